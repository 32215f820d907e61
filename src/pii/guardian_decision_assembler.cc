#include "guardian_decision_assembler.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace GuardianPII {

DetectionResult DecisionAssembler::Assemble(std::vector<Entity> entities,
                                            const ModePolicy& policy,
                                            ResultMetadata metadata) {
  DetectionResult result;
  result.mode = policy.name;

  size_t dropped = 0;
  for (auto& entity : entities) {
    if (!std::isfinite(entity.confidence)) {
      entity.confidence = 0.0;
    }
    entity.confidence = std::clamp(entity.confidence, 0.0, 1.0);
    if (ShouldRetain(policy, entity)) {
      result.entities.push_back(std::move(entity));
    } else {
      dropped++;
    }
  }

  std::sort(result.entities.begin(), result.entities.end(),
            [](const Entity& a, const Entity& b) {
              return std::make_tuple(a.start, a.end, static_cast<int>(a.type)) <
                     std::make_tuple(b.start, b.end, static_cast<int>(b.type));
            });

  metadata.by_type.clear();
  for (const auto& entity : result.entities) {
    metadata.by_type[entity.type]++;
    result.aggregate_confidence = std::max(result.aggregate_confidence, entity.confidence);
  }

  result.has_pii = !result.entities.empty();
  result.classification = result.has_pii ? Classification::NON_PUBLIC : Classification::PUBLIC;
  result.metadata = std::move(metadata);

  LOG_DEBUG("DecisionAssembler", "Retained " + std::to_string(result.entities.size()) +
            ", dropped " + std::to_string(dropped) + " below threshold");
  return result;
}

}  // namespace GuardianPII
