#ifndef GUARDIAN_BATCH_DETECTOR_H_
#define GUARDIAN_BATCH_DETECTOR_H_

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "guardian_detector.h"
#include "guardian_thread_pool.h"

namespace GuardianPII {

// Totals over a batch of responses
struct BatchSummary {
  size_t texts = 0;
  size_t with_pii = 0;
  size_t rejected = 0;   // Invalid encoding
  size_t degraded = 0;
  size_t afn_triggered = 0;
  std::map<PIIType, int> by_type;

  std::string ToString() const;
};

/**
 * Runs one detector over many texts in parallel. Texts are independent,
 * so the only shared state is the detector itself. Responses come back
 * in input order.
 */
class GuardianBatchDetector {
 public:
  GuardianBatchDetector(std::shared_ptr<const GuardianDetector> detector, size_t workers);
  ~GuardianBatchDetector();

  GuardianBatchDetector(const GuardianBatchDetector&) = delete;
  GuardianBatchDetector& operator=(const GuardianBatchDetector&) = delete;

  std::vector<DetectResponse> DetectAll(const std::vector<std::string>& texts);

  static BatchSummary Summarize(const std::vector<DetectResponse>& responses);

  size_t GetWorkerCount() const { return pool_->GetWorkerCount(); }

 private:
  std::shared_ptr<const GuardianDetector> detector_;
  std::unique_ptr<guardian::ThreadPool> pool_;
};

}  // namespace GuardianPII

#endif  // GUARDIAN_BATCH_DETECTOR_H_
