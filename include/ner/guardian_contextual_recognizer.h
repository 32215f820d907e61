#ifndef GUARDIAN_CONTEXTUAL_RECOGNIZER_H_
#define GUARDIAN_CONTEXTUAL_RECOGNIZER_H_

#include <cstddef>
#include <string>
#include <vector>
#include "guardian_types.h"

namespace GuardianPII {

// A span reported by a contextual recognizer. Offsets are byte offsets
// into the text that was sent to it.
struct ContextualCandidate {
  PIIType type = PIIType::NAME;
  size_t start = 0;
  size_t end = 0;
  double confidence = 0.0;
};

// UNAVAILABLE means the recognizer could not run, which is different
// from OK with no candidates.
enum class RecognizeStatus {
  OK,
  UNAVAILABLE,
  TIMEOUT,
  PROTOCOL_ERROR,
  BUSY  // Too many earlier calls still running past their timeout
};

std::string RecognizeStatusToString(RecognizeStatus status);

// Entity for a candidate whose span lies inside |text|
Entity ToContextualEntity(const ContextualCandidate& candidate, const std::string& text);

struct RecognizeRequest {
  std::string text;
  size_t max_length = 0;   // Bytes the recognizer may look at
  double min_score = 0.0;  // Candidates below this may be omitted
};

struct RecognizeResponse {
  RecognizeStatus status = RecognizeStatus::OK;
  std::vector<ContextualCandidate> candidates;
  std::string error;
};

/**
 * Source of NAME, ADDRESS, BIRTH_DATE and ORG candidates.
 *
 * Implementations must be safe to call from several threads at once,
 * up to GetConcurrencyLimit() concurrent calls.
 */
class ContextualRecognizer {
 public:
  virtual ~ContextualRecognizer() = default;

  virtual RecognizeResponse Recognize(const RecognizeRequest& request) = 0;

  virtual std::string GetName() const = 0;

  // Longest input, in bytes, the recognizer accepts
  virtual size_t GetMaxLength() const = 0;

  virtual size_t GetConcurrencyLimit() const { return 1; }
};

// Always reports UNAVAILABLE. Stands in when contextual detection is off.
class UnavailableRecognizer : public ContextualRecognizer {
 public:
  explicit UnavailableRecognizer(const std::string& reason = "contextual recognizer disabled")
      : reason_(reason) {}

  RecognizeResponse Recognize(const RecognizeRequest& request) override;
  std::string GetName() const override { return "unavailable"; }
  size_t GetMaxLength() const override { return 0; }

 private:
  std::string reason_;
};

}  // namespace GuardianPII

#endif  // GUARDIAN_CONTEXTUAL_RECOGNIZER_H_
