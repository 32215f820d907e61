#ifndef GUARDIAN_DECISION_ASSEMBLER_H_
#define GUARDIAN_DECISION_ASSEMBLER_H_

#include <vector>
#include "guardian_mode_policy.h"
#include "guardian_types.h"

namespace GuardianPII {

/**
 * Turns scored entities into the final DetectionResult.
 *
 * Drops entities that fail the policy's retention rule, orders the rest by
 * start and fills in has_pii, classification, aggregate confidence and the
 * per-type counts. Any retained entity makes the text NON_PUBLIC,
 * however low its confidence.
 */
class DecisionAssembler {
 public:
  static DetectionResult Assemble(std::vector<Entity> entities, const ModePolicy& policy,
                                  ResultMetadata metadata);
};

}  // namespace GuardianPII

#endif  // GUARDIAN_DECISION_ASSEMBLER_H_
