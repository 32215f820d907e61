#include "guardian_types.h"
#include <sstream>

namespace GuardianPII {

std::string GetTypeName(PIIType type) {
  switch (type) {
    case PIIType::CPF: return "CPF";
    case PIIType::CNPJ: return "CNPJ";
    case PIIType::PHONE: return "PHONE";
    case PIIType::EMAIL: return "EMAIL";
    case PIIType::CEP: return "CEP";
    case PIIType::RG: return "RG";
    case PIIType::CNH: return "CNH";
    case PIIType::PIS_PASEP: return "PIS_PASEP";
    case PIIType::VOTER_ID: return "VOTER_ID";
    case PIIType::CREDIT_CARD: return "CREDIT_CARD";
    case PIIType::VEHICLE_PLATE: return "VEHICLE_PLATE";
    case PIIType::PASSPORT: return "PASSPORT";
    case PIIType::NAME: return "NAME";
    case PIIType::ADDRESS: return "ADDRESS";
    case PIIType::BIRTH_DATE: return "BIRTH_DATE";
    case PIIType::ORG: return "ORG";
    default: return "UNKNOWN";
  }
}

bool ParseTypeName(const std::string& name, PIIType* type) {
  for (int i = 0; i < kPIITypeCount; ++i) {
    PIIType candidate = static_cast<PIIType>(i);
    if (GetTypeName(candidate) == name) {
      *type = candidate;
      return true;
    }
  }
  return false;
}

bool IsContextualType(PIIType type) {
  return type == PIIType::NAME || type == PIIType::ADDRESS ||
         type == PIIType::BIRTH_DATE || type == PIIType::ORG;
}

std::string GetValidationStatusName(ValidationStatus status) {
  switch (status) {
    case ValidationStatus::VALID: return "valid";
    case ValidationStatus::INVALID: return "invalid";
    case ValidationStatus::NOT_APPLICABLE: return "not_applicable";
    default: return "unknown";
  }
}

int CountSources(SourceSet sources) {
  int count = 0;
  for (SourceSet s = sources; s; s &= static_cast<SourceSet>(s - 1)) {
    count++;
  }
  return count;
}

std::vector<std::string> GetSourceNames(SourceSet sources) {
  // Alphabetical, so serialized results are stable
  std::vector<std::string> names;
  if (sources & SOURCE_AFN) names.push_back("afn");
  if (sources & SOURCE_CONTEXTUAL) names.push_back("contextual");
  if (sources & SOURCE_REGEX) names.push_back("regex");
  return names;
}

std::string GetClassificationName(Classification classification) {
  return classification == Classification::NON_PUBLIC ? "NON_PUBLIC" : "PUBLIC";
}

std::string ResultMetadata::ToString() const {
  std::stringstream ss;
  int total = 0;
  for (const auto& [type, count] : by_type) {
    total += count;
  }
  ss << total << " entities";
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
  if (contextual_degraded) ss << " degraded=" << degraded_reason;
  if (truncated) ss << " truncated";
  if (afn_triggered) ss << " afn_added=" << afn_added;
  return ss.str();
}

}  // namespace GuardianPII
