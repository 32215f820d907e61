#include "guardian_batch_detector.h"
#include "logger.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <sstream>

namespace GuardianPII {

std::string BatchSummary::ToString() const {
  std::stringstream ss;
  ss << texts << " texts, " << with_pii << " with PII";
  if (rejected > 0) ss << ", " << rejected << " rejected";
  if (degraded > 0) ss << ", " << degraded << " degraded";
  if (afn_triggered > 0) ss << ", " << afn_triggered << " escalated";
  if (!by_type.empty()) {
    ss << " (";
    bool first = true;
    for (const auto& [type, count] : by_type) {
      if (!first) ss << ", ";
      ss << GetTypeName(type) << ":" << count;
      first = false;
    }
    ss << ")";
  }
  return ss.str();
}

GuardianBatchDetector::GuardianBatchDetector(std::shared_ptr<const GuardianDetector> detector,
                                             size_t workers)
    : detector_(std::move(detector)),
      pool_(std::make_unique<guardian::ThreadPool>(std::max<size_t>(1, workers))) {}

GuardianBatchDetector::~GuardianBatchDetector() {
  pool_->Shutdown();
}

std::vector<DetectResponse> GuardianBatchDetector::DetectAll(const std::vector<std::string>& texts) {
  auto started = std::chrono::steady_clock::now();

  std::vector<std::future<DetectResponse>> futures;
  futures.reserve(texts.size());
  for (const auto& text : texts) {
    // The detector and the text both outlive every task, since we wait below
    const GuardianDetector* detector = detector_.get();
    const std::string* input = &text;
    futures.push_back(pool_->Submit([detector, input]() { return detector->Detect(*input); }));
  }

  std::vector<DetectResponse> responses;
  responses.reserve(texts.size());
  for (size_t i = 0; i < futures.size(); ++i) {
    if (!futures[i].valid()) {
      LOG_WARN("BatchDetector", "Worker pool rejected text " + std::to_string(i) +
               ", detecting inline");
      responses.push_back(detector_->Detect(texts[i]));
      continue;
    }
    responses.push_back(futures[i].get());
  }

  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started).count();
  LOG_INFO("BatchDetector", "Processed " + std::to_string(texts.size()) + " texts on " +
           std::to_string(pool_->GetWorkerCount()) + " workers in " +
           std::to_string(elapsed_ms) + " ms (longest queue wait " +
           std::to_string(pool_->GetMetrics().busiest_wait_us.load() / 1000) + " ms)");
  return responses;
}

BatchSummary GuardianBatchDetector::Summarize(const std::vector<DetectResponse>& responses) {
  BatchSummary summary;
  summary.texts = responses.size();
  for (const auto& response : responses) {
    if (!response.success()) {
      summary.rejected++;
      continue;
    }
    const DetectionResult& result = response.result;
    if (result.has_pii) summary.with_pii++;
    if (result.metadata.contextual_degraded) summary.degraded++;
    if (result.metadata.afn_triggered) summary.afn_triggered++;
    for (const auto& [type, count] : result.metadata.by_type) {
      summary.by_type[type] += count;
    }
  }
  return summary;
}

}  // namespace GuardianPII
