#pragma once

#include <cstddef>
#include <vector>
#include "guardian_types.h"

namespace GuardianPII {

/**
 * FusionEngine - Merges regex, contextual and AFN entities into one
 * non-overlapping set.
 *
 * Candidates are swept left to right in a fixed order (start, longer span
 * first, source priority, type order). A candidate that overlaps accepted
 * entities must beat each of them to replace them. Comparison order:
 * base confidence, valid checksum, longer span, source priority, type
 * order; a full tie keeps the entity already accepted.
 *
 * A structured (regex or AFN) entity and a contextual entity covering
 * nearly the same span are merged instead: the result carries both
 * sources and the higher base confidence.
 */
class FusionEngine {
 public:
  // Spans whose starts and ends both differ by at most this are "the same"
  static constexpr size_t kNearSpanTolerance = 2;

  static std::vector<Entity> Fuse(const std::vector<Entity>& regex_entities,
                                  const std::vector<Entity>& contextual_entities);

  // Same as above over an already combined list
  static std::vector<Entity> Fuse(std::vector<Entity> entities);

  // 0 = validated regex or AFN, 1 = contextual, 2 = unvalidated regex
  static int SourcePriority(const Entity& entity);

  // True if |challenger| should replace |incumbent|
  static bool Beats(const Entity& challenger, const Entity& incumbent);

  static bool IsNearSameSpan(const Entity& a, const Entity& b);

 private:
  static bool CanCorroborate(const Entity& a, const Entity& b);
  static void Merge(Entity& into, const Entity& other, bool take_other_span);
};

}  // namespace GuardianPII
