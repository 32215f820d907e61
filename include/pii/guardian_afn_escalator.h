#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "guardian_contextual_recognizer.h"
#include "guardian_mode_policy.h"
#include "guardian_types.h"

namespace GuardianPII {

// What an escalation pass did
struct AfnOutcome {
  bool triggered = false;
  int numeric_added = 0;
  int keyword_added = 0;
  int contextual_added = 0;
  int rescored = 0;
  bool contextual_rescan_ran = false;
  RecognizeStatus contextual_status = RecognizeStatus::OK;
};

/**
 * AfnEscalator - Anti-false-negative pass that trades precision for recall.
 *
 * Runs when the policy allows it and few entities survived the first
 * pass. Adds checksum-valid digit runs the patterns missed and digits
 * introduced by an explicit keyword, optionally
 * asks the contextual recognizer again at half the threshold, fuses the
 * additions, and re-scores weak entities with a wider context window.
 */
class AfnEscalator {
 public:
  static constexpr double kNumericConfidence = 0.75;
  static constexpr double kKeywordConfidence = 0.75;

  // Re-requests contextual candidates at the given minimum score
  using ContextualRescan = std::function<RecognizeResponse(double min_score)>;

  static bool ShouldTrigger(const ModePolicy& policy, size_t retained_count);

  /**
   * Finds runs of 11 or 14 digits, separated only by '.', '-' or '/',
   * that pass the CPF or CNPJ checksum. Runs touching an entity at or
   * above |min_confidence|, or an identical valid entity, are skipped.
   */
  static std::vector<Entity> NumericRescan(const std::string& text,
                                           const std::vector<Entity>& existing,
                                           double min_confidence);

  /**
   * Digits that an explicit keyword introduces but no matcher claimed:
   * a local phone number (4 or 5 digits, optional '-' or space, 4 digits)
   * after "telefone", "celular", "fone", "contato" or "número", and a
   * run of 9 or more digits after "CPF". Spans overlapping an entity that
   * |policy| retains are skipped, as are spans overlapping a same-type
   * entity whose checksum already failed.
   */
  static std::vector<Entity> KeywordRescan(const std::string& text,
                                           const std::vector<Entity>& existing,
                                           const ModePolicy& policy);

  /**
   * Applies a lowered-threshold contextual response. Candidates matching
   * an existing entity lower that entity's cutoff; the rest are returned
   * as new entities held to |lowered_threshold|.
   */
  static std::vector<Entity> AdmitLowered(const std::string& text,
                                          const std::vector<ContextualCandidate>& candidates,
                                          std::vector<Entity>& existing,
                                          double lowered_threshold);

  // Re-scores entities below |below| with the expanded window. Returns the count.
  static int ExpandContext(std::vector<Entity>& entities, const std::string& text,
                           double below);

  // Full pass over fused, scored |entities|. |rescan| may be empty when the
  // recognizer is degraded.
  static AfnOutcome Run(const std::string& text, const ModePolicy& policy,
                        std::vector<Entity>& entities, const ContextualRescan& rescan);
};

}  // namespace GuardianPII
