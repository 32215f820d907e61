#ifndef GUARDIAN_DETECTOR_H_
#define GUARDIAN_DETECTOR_H_

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "guardian_contextual_recognizer.h"
#include "guardian_mode_policy.h"
#include "guardian_pattern_library.h"
#include "guardian_thread_pool.h"
#include "guardian_types.h"

namespace GuardianPII {

enum class DetectStatus {
  OK,
  INVALID_ENCODING  // Text is not valid UTF-8 and cannot be scanned safely
};

std::string DetectStatusToString(DetectStatus status);

struct DetectResponse {
  DetectStatus status = DetectStatus::OK;
  std::string error;
  DetectionResult result;

  bool success() const { return status == DetectStatus::OK; }
};

struct DetectorOptions {
  int recognizer_timeout_ms = 2000;
  bool compute_fingerprint = true;
};

/**
 * GuardianDetector - Full detection pipeline for one mode policy.
 *
 * Pattern extraction and the contextual recognizer run over the same
 * text, regex matches are validated, everything is fused and scored, the
 * AFN escalator runs when the policy asks for it and the decision
 * assembler produces the result.
 *
 * The recognizer is the only stage that may block. Each call runs on a
 * pool sized to the recognizer's concurrency limit and is abandoned after
 * recognizer_timeout_ms, in which case the result is marked degraded and
 * carries regex findings only. An abandoned call keeps its worker until
 * the recognizer returns; while every worker is held that way new calls
 * are not queued and degrade at once with reason "busy".
 *
 * Entity offsets in the returned result count UTF-8 characters.
 *
 * Detect() is const and safe to call from many threads at once.
 *
 * Usage:
 *   std::string error;
 *   auto detector = GuardianDetector::Create(policy, recognizer, {}, &error);
 *   if (!detector) { ... }
 *   DetectResponse response = detector->Detect(text);
 */
class GuardianDetector {
 public:
  // Base confidence multiplier for matches that fail validation
  static constexpr double kInvalidPenalty = 0.5;

  /**
   * Builds a detector, or returns nullptr with |error| set when |policy|
   * fails validation. A null |recognizer| runs regex-only and marks every
   * result degraded.
   */
  static std::unique_ptr<GuardianDetector> Create(
      const ModePolicy& policy,
      std::shared_ptr<ContextualRecognizer> recognizer,
      const DetectorOptions& options,
      std::string* error);

  ~GuardianDetector();

  GuardianDetector(const GuardianDetector&) = delete;
  GuardianDetector& operator=(const GuardianDetector&) = delete;

  DetectResponse Detect(const std::string& text) const;

  const ModePolicy& GetPolicy() const { return policy_; }
  const ContextualRecognizer& GetRecognizer() const { return *recognizer_; }

  // Validated entities for raw pattern matches
  static std::vector<Entity> BuildRegexEntities(const std::vector<RawCandidate>& candidates);

 private:
  struct RecognizerCall {
    RecognizeResponse response;
    bool truncated = false;
  };

  // Shared with pool tasks, which may outlive the detector call that
  // submitted them
  struct CallLedger {
    std::mutex mutex;
    size_t stalled = 0;  // Abandoned calls still inside the recognizer
  };

  struct CallState {
    bool started = false;
    bool finished = false;
    bool abandoned = false;
  };

  GuardianDetector(const ModePolicy& policy,
                   std::shared_ptr<ContextualRecognizer> recognizer,
                   const DetectorOptions& options);

  RecognizerCall CallRecognizer(const std::string& text, double min_score) const;

  // Drops malformed spans. False if the recognizer broke its contract.
  static bool SanitizeCandidates(const std::string& scanned, RecognizeResponse& response);

  // Rewrites byte offsets of sorted |entities| as character offsets
  static void ToCharacterOffsets(const std::string& text, std::vector<Entity>& entities);

  ModePolicy policy_;
  std::shared_ptr<ContextualRecognizer> recognizer_;
  DetectorOptions options_;
  std::unique_ptr<guardian::ThreadPool> pool_;
  size_t workers_ = 1;
  std::shared_ptr<CallLedger> ledger_;
};

}  // namespace GuardianPII

#endif  // GUARDIAN_DETECTOR_H_
