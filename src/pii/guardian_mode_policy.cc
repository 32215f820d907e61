#include "guardian_mode_policy.h"
#include <cmath>

namespace GuardianPII {

std::string GetAggressiveRegexName(AggressiveRegex value) {
  switch (value) {
    case AggressiveRegex::OFF: return "off";
    case AggressiveRegex::PARTIAL: return "partial";
    case AggressiveRegex::ON: return "on";
    default: return "unknown";
  }
}

bool ParseAggressiveRegex(const std::string& name, AggressiveRegex* value) {
  if (name == "off") {
    *value = AggressiveRegex::OFF;
  } else if (name == "partial") {
    *value = AggressiveRegex::PARTIAL;
  } else if (name == "on") {
    *value = AggressiveRegex::ON;
  } else {
    return false;
  }
  return true;
}

std::string GetAfnPassesName(AfnPasses value) {
  switch (value) {
    case AfnPasses::NONE: return "none";
    case AfnPasses::SINGLE: return "single";
    case AfnPasses::DOUBLE: return "double";
    default: return "unknown";
  }
}

bool ParseAfnPasses(const std::string& name, AfnPasses* value) {
  if (name == "none") {
    *value = AfnPasses::NONE;
  } else if (name == "single") {
    *value = AfnPasses::SINGLE;
  } else if (name == "double") {
    *value = AfnPasses::DOUBLE;
  } else {
    return false;
  }
  return true;
}

const std::vector<ModePolicy>& GetPresets() {
  // name, threshold, regex tier, afn passes, keep bad checksums, afn trigger
  static const std::vector<ModePolicy> kPresets = {
    {"strict", 0.50, AggressiveRegex::ON, AfnPasses::DOUBLE, true, kAfnAlways, 0.75},
    {"balanced", 0.70, AggressiveRegex::PARTIAL, AfnPasses::SINGLE, false, 2, 0.75},
    {"precise", 0.85, AggressiveRegex::OFF, AfnPasses::NONE, false, 2, 0.75},
  };
  return kPresets;
}

bool FindPreset(const std::string& name, ModePolicy* policy) {
  for (const auto& preset : GetPresets()) {
    if (preset.name == name) {
      *policy = preset;
      return true;
    }
  }
  return false;
}

bool ValidatePolicy(const ModePolicy& policy, std::string* error) {
  if (policy.name.empty()) {
    *error = "policy name is empty";
    return false;
  }
  if (!std::isfinite(policy.base_threshold) ||
      policy.base_threshold <= 0.0 || policy.base_threshold >= 1.0) {
    *error = "base_threshold must be in (0, 1)";
    return false;
  }
  if (policy.afn_trigger_below < 1) {
    *error = "afn_trigger_below must be at least 1";
    return false;
  }
  if (!std::isfinite(policy.afn_min_confidence) ||
      policy.afn_min_confidence < 0.0 || policy.afn_min_confidence > 1.0) {
    *error = "afn_min_confidence must be in [0, 1]";
    return false;
  }
  return true;
}

double EffectiveThreshold(const ModePolicy& policy, const Entity& entity) {
  return entity.acceptance_threshold >= 0.0 ? entity.acceptance_threshold
                                            : policy.base_threshold;
}

bool ShouldRetain(const ModePolicy& policy, const Entity& entity) {
  // Small tolerance so 0.70 + 0.05 style sums are not lost to rounding
  constexpr double kEpsilon = 1e-9;
  if (entity.confidence + kEpsilon >= EffectiveThreshold(policy, entity)) {
    return true;
  }
  return policy.accept_invalid_checksum &&
         (entity.type == PIIType::CPF || entity.type == PIIType::CNPJ) &&
         entity.validation_status == ValidationStatus::INVALID &&
         entity.structurally_valid;
}

}  // namespace GuardianPII
