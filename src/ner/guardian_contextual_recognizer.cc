#include "guardian_contextual_recognizer.h"

namespace GuardianPII {

std::string RecognizeStatusToString(RecognizeStatus status) {
  switch (status) {
    case RecognizeStatus::OK: return "ok";
    case RecognizeStatus::UNAVAILABLE: return "unavailable";
    case RecognizeStatus::TIMEOUT: return "timeout";
    case RecognizeStatus::PROTOCOL_ERROR: return "protocol_error";
    case RecognizeStatus::BUSY: return "busy";
    default: return "unknown";
  }
}

Entity ToContextualEntity(const ContextualCandidate& candidate, const std::string& text) {
  Entity entity;
  entity.type = candidate.type;
  entity.start = candidate.start;
  entity.end = candidate.end;
  entity.raw_value = text.substr(candidate.start, candidate.end - candidate.start);
  entity.normalized_value = entity.raw_value;
  entity.base_confidence = candidate.confidence;
  entity.confidence = candidate.confidence;
  entity.validation_status = ValidationStatus::NOT_APPLICABLE;
  entity.sources = SOURCE_CONTEXTUAL;
  entity.structurally_valid = true;
  entity.reason = "contextual";
  return entity;
}

RecognizeResponse UnavailableRecognizer::Recognize(const RecognizeRequest& /*request*/) {
  RecognizeResponse response;
  response.status = RecognizeStatus::UNAVAILABLE;
  response.error = reason_;
  return response;
}

}  // namespace GuardianPII
