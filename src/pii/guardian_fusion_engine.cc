#include "guardian_fusion_engine.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace GuardianPII {

namespace {

constexpr double kConfidenceEpsilon = 1e-9;

bool IsStructured(const Entity& entity) {
  return (entity.sources & (SOURCE_REGEX | SOURCE_AFN)) != 0;
}

size_t Distance(size_t a, size_t b) {
  return a > b ? a - b : b - a;
}

}  // namespace

int FusionEngine::SourcePriority(const Entity& entity) {
  if (entity.sources & SOURCE_AFN) {
    return 0;
  }
  if (entity.sources & SOURCE_REGEX) {
    return entity.validation_status == ValidationStatus::VALID ? 0 : 2;
  }
  return 1;
}

bool FusionEngine::Beats(const Entity& challenger, const Entity& incumbent) {
  double diff = challenger.base_confidence - incumbent.base_confidence;
  if (std::fabs(diff) > kConfidenceEpsilon) {
    return diff > 0;
  }

  bool challenger_valid = challenger.validation_status == ValidationStatus::VALID;
  bool incumbent_valid = incumbent.validation_status == ValidationStatus::VALID;
  if (challenger_valid != incumbent_valid) {
    return challenger_valid;
  }

  if (challenger.Length() != incumbent.Length()) {
    return challenger.Length() > incumbent.Length();
  }

  int challenger_priority = SourcePriority(challenger);
  int incumbent_priority = SourcePriority(incumbent);
  if (challenger_priority != incumbent_priority) {
    return challenger_priority < incumbent_priority;
  }

  if (challenger.type != incumbent.type) {
    return static_cast<int>(challenger.type) < static_cast<int>(incumbent.type);
  }
  return false;
}

bool FusionEngine::IsNearSameSpan(const Entity& a, const Entity& b) {
  return Distance(a.start, b.start) <= kNearSpanTolerance &&
         Distance(a.end, b.end) <= kNearSpanTolerance;
}

bool FusionEngine::CanCorroborate(const Entity& a, const Entity& b) {
  bool a_contextual = (a.sources & SOURCE_CONTEXTUAL) != 0;
  bool b_contextual = (b.sources & SOURCE_CONTEXTUAL) != 0;
  // One side from the structured layers, the other from the contextual one
  return IsNearSameSpan(a, b) &&
         ((IsStructured(a) && b_contextual && !IsStructured(b)) ||
          (IsStructured(b) && a_contextual && !IsStructured(a)));
}

void FusionEngine::Merge(Entity& into, const Entity& other, bool take_other_span) {
  SourceSet sources = static_cast<SourceSet>(into.sources | other.sources);
  double base = std::max(into.base_confidence, other.base_confidence);
  double threshold = into.acceptance_threshold;
  if (other.acceptance_threshold >= 0.0 &&
      (threshold < 0.0 || other.acceptance_threshold < threshold)) {
    threshold = other.acceptance_threshold;
  }

  if (take_other_span) {
    into = other;
  }
  into.sources = sources;
  into.base_confidence = base;
  into.confidence = std::max(into.confidence, base);
  into.acceptance_threshold = threshold;
  into.reason = "corroborated";
}

std::vector<Entity> FusionEngine::Fuse(const std::vector<Entity>& regex_entities,
                                       const std::vector<Entity>& contextual_entities) {
  std::vector<Entity> all;
  all.reserve(regex_entities.size() + contextual_entities.size());
  all.insert(all.end(), regex_entities.begin(), regex_entities.end());
  all.insert(all.end(), contextual_entities.begin(), contextual_entities.end());
  return Fuse(std::move(all));
}

std::vector<Entity> FusionEngine::Fuse(std::vector<Entity> entities) {
  std::stable_sort(entities.begin(), entities.end(), [](const Entity& a, const Entity& b) {
    if (a.start != b.start) return a.start < b.start;
    if (a.Length() != b.Length()) return a.Length() > b.Length();
    int pa = SourcePriority(a);
    int pb = SourcePriority(b);
    if (pa != pb) return pa < pb;
    if (a.type != b.type) return static_cast<int>(a.type) < static_cast<int>(b.type);
    return a.base_confidence > b.base_confidence;
  });

  std::vector<Entity> accepted;
  int merged = 0;
  int replaced = 0;
  int rejected = 0;

  for (const auto& candidate : entities) {
    std::vector<size_t> overlapping;
    for (size_t i = 0; i < accepted.size(); ++i) {
      if (accepted[i].Overlaps(candidate)) {
        overlapping.push_back(i);
      }
    }

    if (overlapping.empty()) {
      accepted.push_back(candidate);
      continue;
    }

    // Corroboration: same span seen by both layers
    bool was_merged = false;
    for (size_t idx : overlapping) {
      Entity& existing = accepted[idx];
      if (!CanCorroborate(existing, candidate)) {
        continue;
      }
      // The structured side keeps its span, unless that would collide
      // with a neighbour
      bool take_candidate_span = IsStructured(candidate);
      if (take_candidate_span) {
        for (size_t j : overlapping) {
          if (j != idx) {
            take_candidate_span = false;
            break;
          }
        }
      }
      Merge(existing, candidate, take_candidate_span);
      merged++;
      was_merged = true;
      break;
    }
    if (was_merged) {
      continue;
    }

    bool wins_all = std::all_of(overlapping.begin(), overlapping.end(),
                                [&](size_t idx) { return Beats(candidate, accepted[idx]); });
    if (!wins_all) {
      rejected++;
      continue;
    }

    for (auto it = overlapping.rbegin(); it != overlapping.rend(); ++it) {
      accepted.erase(accepted.begin() + static_cast<std::ptrdiff_t>(*it));
    }
    Entity winner = candidate;
    winner.reason = "won_overlap";
    accepted.push_back(std::move(winner));
    replaced++;
  }

  std::sort(accepted.begin(), accepted.end(), [](const Entity& a, const Entity& b) {
    return std::make_tuple(a.start, a.end, static_cast<int>(a.type)) <
           std::make_tuple(b.start, b.end, static_cast<int>(b.type));
  });

  LOG_DEBUG("FusionEngine", "Fused " + std::to_string(entities.size()) + " candidates into " +
            std::to_string(accepted.size()) + " entities (merged=" + std::to_string(merged) +
            ", replaced=" + std::to_string(replaced) + ", rejected=" + std::to_string(rejected) + ")");
  return accepted;
}

}  // namespace GuardianPII
