#ifndef GUARDIAN_RESULT_JSON_H_
#define GUARDIAN_RESULT_JSON_H_

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "guardian_batch_detector.h"
#include "guardian_detector.h"
#include "guardian_types.h"

namespace GuardianPII {

using json = nlohmann::json;

// Confidences are rounded to four decimals so output is stable across
// platforms.
json EntityToJson(const Entity& entity);
json MetadataToJson(const ResultMetadata& metadata);
json ResultToJson(const DetectionResult& result);

// {"status": ..., "error": ...} on failure, the result otherwise
json ResponseToJson(const DetectResponse& response);

json SummaryToJson(const BatchSummary& summary);

}  // namespace GuardianPII

#endif  // GUARDIAN_RESULT_JSON_H_
