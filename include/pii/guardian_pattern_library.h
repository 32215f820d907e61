#ifndef GUARDIAN_PATTERN_LIBRARY_H_
#define GUARDIAN_PATTERN_LIBRARY_H_

#include <regex>
#include <string>
#include <vector>
#include "guardian_mode_policy.h"
#include "guardian_types.h"

namespace GuardianPII {

/**
 * GuardianPatternLibrary - Precompiled structural matchers for Brazilian
 * identifiers (CPF, CNPJ, phone, email, CEP, RG, CNH, PIS/PASEP, voter
 * title, payment card, vehicle plate, passport).
 *
 * Built once per process and shared read-only across threads. Every
 * matcher uses bounded quantifiers only, so adversarial input cannot
 * trigger catastrophic backtracking.
 *
 * Usage:
 *   const auto& library = GuardianPatternLibrary::GetInstance();
 *   auto candidates = library.Extract(text, AggressiveRegex::PARTIAL);
 */
class GuardianPatternLibrary {
 public:
  static const GuardianPatternLibrary& GetInstance();

  /**
   * Run every matcher enabled for |tier| over |text|.
   *
   * Candidates may overlap each other. Output is ordered by start, then
   * type declaration order, then matcher order, with duplicate
   * (type, start, end) entries removed. Matches touching a '*' mask
   * character are skipped.
   */
  std::vector<RawCandidate> Extract(const std::string& text,
                                    AggressiveRegex tier) const;

  size_t GetPatternCount() const { return patterns_.size(); }

 private:
  struct Pattern {
    PIIType type;
    std::regex regex;
    double base_confidence;
    AggressiveRegex min_tier;  // Lowest tier that enables this matcher
    int index;                 // Order within its type
  };

  GuardianPatternLibrary();
  GuardianPatternLibrary(const GuardianPatternLibrary&) = delete;
  GuardianPatternLibrary& operator=(const GuardianPatternLibrary&) = delete;

  void InitializePatterns();
  void AddPattern(PIIType type, const char* expression, double base_confidence,
                  AggressiveRegex min_tier = AggressiveRegex::OFF);

  static bool IsMasked(const std::string& text, size_t start, size_t end);

  std::vector<Pattern> patterns_;
};

}  // namespace GuardianPII

#endif  // GUARDIAN_PATTERN_LIBRARY_H_
