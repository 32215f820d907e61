#include "guardian_result_json.h"
#include <cmath>

namespace GuardianPII {

namespace {

double RoundConfidence(double value) {
  return std::round(value * 10000.0) / 10000.0;
}

json CountsToJson(const std::map<PIIType, int>& counts) {
  json out = json::object();
  for (const auto& [type, count] : counts) {
    out[GetTypeName(type)] = count;
  }
  return out;
}

}  // namespace

json EntityToJson(const Entity& entity) {
  json out;
  out["type"] = GetTypeName(entity.type);
  out["value"] = entity.raw_value;
  out["normalized_value"] = entity.normalized_value;
  out["start"] = entity.start;
  out["end"] = entity.end;
  out["confidence"] = RoundConfidence(entity.confidence);
  out["validation_status"] = GetValidationStatusName(entity.validation_status);
  out["sources"] = GetSourceNames(entity.sources);
  out["reason"] = entity.reason;
  return out;
}

json MetadataToJson(const ResultMetadata& metadata) {
  json out;
  out["contextual_degraded"] = metadata.contextual_degraded;
  if (metadata.contextual_degraded) {
    out["degraded_reason"] = metadata.degraded_reason;
  }
  out["truncated"] = metadata.truncated;
  out["afn_triggered"] = metadata.afn_triggered;
  out["afn_added"] = metadata.afn_added;
  out["by_type"] = CountsToJson(metadata.by_type);
  if (!metadata.text_fingerprint.empty()) {
    out["text_sha256"] = metadata.text_fingerprint;
  }
  return out;
}

json ResultToJson(const DetectionResult& result) {
  json out;
  out["has_pii"] = result.has_pii;
  out["classification"] = GetClassificationName(result.classification);
  out["aggregate_confidence"] = RoundConfidence(result.aggregate_confidence);
  out["mode"] = result.mode;

  json entities = json::array();
  for (const auto& entity : result.entities) {
    entities.push_back(EntityToJson(entity));
  }
  out["entities"] = entities;
  out["metadata"] = MetadataToJson(result.metadata);
  return out;
}

json ResponseToJson(const DetectResponse& response) {
  if (!response.success()) {
    json out;
    out["status"] = DetectStatusToString(response.status);
    out["error"] = response.error;
    return out;
  }
  return ResultToJson(response.result);
}

json SummaryToJson(const BatchSummary& summary) {
  json out;
  out["texts"] = summary.texts;
  out["with_pii"] = summary.with_pii;
  out["rejected"] = summary.rejected;
  out["degraded"] = summary.degraded;
  out["afn_triggered"] = summary.afn_triggered;
  out["by_type"] = CountsToJson(summary.by_type);
  return out;
}

}  // namespace GuardianPII
