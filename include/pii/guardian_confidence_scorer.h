#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "guardian_types.h"

namespace GuardianPII {

// How an entity's final confidence was reached
struct ScoreBreakdown {
  double base = 0.0;
  double validation = 0.0;
  double keyword = 0.0;
  double corroboration = 0.0;
  double final_confidence = 0.0;

  std::string ToString() const;
};

/**
 * ConfidenceScorer - Final per-entity confidence.
 *
 * confidence = min(1, base + bonuses). Scoring always starts again from
 * base_confidence, so scoring an entity twice with the same window gives
 * the same value.
 */
class ConfidenceScorer {
 public:
  static constexpr double kValidBonus = 0.05;
  static constexpr double kKeywordBonus = 0.03;
  static constexpr double kCorroborationBonus = 0.02;

  static constexpr size_t kContextWindow = 50;
  static constexpr size_t kExpandedContextWindow = 100;

  static ScoreBreakdown Score(Entity& entity, const std::string& text,
                              size_t window = kContextWindow);

  static void ScoreAll(std::vector<Entity>& entities, const std::string& text);

  /**
   * Case-insensitive search for an indicator keyword within |window|
   * characters on either side of the byte span [start, end).
   */
  static bool HasKeywordNear(const std::string& text, size_t start, size_t end,
                             size_t window);

  // Lowercase indicator keywords (UTF-8)
  static const std::vector<std::string>& GetKeywords();

  // Types whose valid verdict earns the validation bonus
  static bool EarnsValidationBonus(PIIType type);
};

}  // namespace GuardianPII
