#ifndef GUARDIAN_MODE_POLICY_H_
#define GUARDIAN_MODE_POLICY_H_

#include <cstddef>
#include <limits>
#include <string>
#include <vector>
#include "guardian_types.h"

namespace GuardianPII {

// Which extra matcher tiers run on top of the formatted patterns
enum class AggressiveRegex {
  OFF,      // Formatted identifiers only
  PARTIAL,  // + bare 11/12-digit runs (CPF, CNH, voter ID), bare 8-digit CEP
  ON        // + local phone numbers without area code
};

enum class AfnPasses {
  NONE,
  SINGLE,  // Numeric rescan and context expansion
  DOUBLE   // + lowered-threshold contextual rescan
};

std::string GetAggressiveRegexName(AggressiveRegex value);
bool ParseAggressiveRegex(const std::string& name, AggressiveRegex* value);
std::string GetAfnPassesName(AfnPasses value);
bool ParseAfnPasses(const std::string& name, AfnPasses* value);

constexpr size_t kAfnAlways = std::numeric_limits<size_t>::max();

/**
 * Thresholds and escalation settings for one detection call.
 * Read-only while a detection runs.
 */
struct ModePolicy {
  std::string name;
  double base_threshold = 0.70;
  AggressiveRegex aggressive_regex = AggressiveRegex::PARTIAL;
  AfnPasses afn_passes = AfnPasses::SINGLE;
  bool accept_invalid_checksum = false;

  // AFN runs when fewer than this many entities are retained
  size_t afn_trigger_below = 2;

  // Digit runs under an entity this confident are not rescanned
  double afn_min_confidence = 0.75;
};

// The closed set of named presets: strict, balanced, precise
const std::vector<ModePolicy>& GetPresets();

// Copies the preset called |name| into |policy|. False if unknown.
bool FindPreset(const std::string& name, ModePolicy* policy);

// Range checks for custom policies. On failure |error| says which field.
bool ValidatePolicy(const ModePolicy& policy, std::string* error);

// Cutoff an entity is held to under |policy|
double EffectiveThreshold(const ModePolicy& policy, const Entity& entity);

// Final retention rule: at or above threshold, or a structurally correct
// CPF/CNPJ with a failed checksum when the policy keeps those.
bool ShouldRetain(const ModePolicy& policy, const Entity& entity);

}  // namespace GuardianPII

#endif  // GUARDIAN_MODE_POLICY_H_
