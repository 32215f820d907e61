#include "guardian_afn_escalator.h"
#include "guardian_confidence_scorer.h"
#include "guardian_fusion_engine.h"
#include "guardian_text_utils.h"
#include "guardian_validators.h"
#include "logger.h"
#include <algorithm>
#include <regex>
#include <utility>

namespace GuardianPII {

namespace {

bool IsRunSeparator(char c) {
  return c == '.' || c == '-' || c == '/';
}

bool IsCovered(const Entity& candidate, PIIType type, const std::vector<Entity>& existing,
               double min_confidence) {
  for (const auto& entity : existing) {
    if (!entity.Overlaps(candidate)) {
      continue;
    }
    if (entity.confidence >= min_confidence) {
      return true;
    }
    if (entity.type == type && entity.start == candidate.start && entity.end == candidate.end &&
        entity.validation_status == ValidationStatus::VALID) {
      return true;
    }
  }
  return false;
}

bool BlocksKeywordCapture(const Entity& capture, const std::vector<Entity>& existing,
                          const ModePolicy& policy) {
  for (const auto& entity : existing) {
    if (!entity.Overlaps(capture)) {
      continue;
    }
    if (ShouldRetain(policy, entity)) {
      return true;
    }
    if (entity.type == capture.type && IsChecksumType(entity.type) &&
        entity.structurally_valid) {
      return true;
    }
  }
  return false;
}

bool IsTrailingSeparator(char c) {
  return c == '.' || c == '-';
}

}  // namespace

bool AfnEscalator::ShouldTrigger(const ModePolicy& policy, size_t retained_count) {
  if (policy.afn_passes == AfnPasses::NONE) {
    return false;
  }
  return policy.afn_trigger_below == kAfnAlways || retained_count < policy.afn_trigger_below;
}

std::vector<Entity> AfnEscalator::NumericRescan(const std::string& text,
                                                const std::vector<Entity>& existing,
                                                double min_confidence) {
  std::vector<Entity> found;
  size_t n = text.size();
  size_t i = 0;

  while (i < n) {
    if (!IsAsciiDigit(text[i])) {
      i++;
      continue;
    }

    // One run: digit groups joined by single separators
    size_t run_start = i;
    size_t j = i;
    size_t digit_count = 0;
    std::vector<std::pair<size_t, size_t>> groups;
    while (true) {
      size_t group_start = j;
      while (j < n && IsAsciiDigit(text[j])) j++;
      groups.emplace_back(group_start, j);
      digit_count += j - group_start;
      if (j + 1 < n && IsRunSeparator(text[j]) && IsAsciiDigit(text[j + 1])) {
        j++;
        continue;
      }
      break;
    }
    size_t run_end = j;

    std::vector<std::pair<size_t, size_t>> spans;
    if (digit_count == 11 || digit_count == 14) {
      spans.emplace_back(run_start, run_end);
    } else {
      for (const auto& group : groups) {
        size_t len = group.second - group.first;
        if (len == 11 || len == 14) {
          spans.push_back(group);
        }
      }
    }

    for (const auto& span : spans) {
      Entity entity;
      entity.start = span.first;
      entity.end = span.second;
      entity.raw_value = text.substr(span.first, span.second - span.first);

      std::string digits = DigitsOnly(entity.raw_value);
      entity.type = digits.size() == 11 ? PIIType::CPF : PIIType::CNPJ;
      ValidationResult verdict = Validate(entity.type, entity.raw_value);
      if (!verdict.valid || IsCovered(entity, entity.type, existing, min_confidence)) {
        continue;
      }

      entity.normalized_value = verdict.normalized;
      entity.base_confidence = kNumericConfidence;
      entity.confidence = kNumericConfidence;
      entity.validation_status = ValidationStatus::VALID;
      entity.structurally_valid = true;
      entity.sources = SOURCE_AFN;
      entity.reason = "afn_numeric";
      found.push_back(std::move(entity));
    }

    i = run_end;
  }
  return found;
}

std::vector<Entity> AfnEscalator::KeywordRescan(const std::string& text,
                                                const std::vector<Entity>& existing,
                                                const ModePolicy& policy) {
  // Run over the folded copy: same byte offsets, lower case keywords
  static const std::regex kPhoneAfterKeyword(
      R"(\b(?:telefone|celular|fone|contato|numero|número)(?:\s|:|é){1,8}(\d{4,5}[-\s]?\d{4})\b)",
      std::regex::ECMAScript | std::regex::optimize);
  static const std::regex kCpfAfterKeyword(
      R"(\b(?:cpf|c\.p\.f\.?)(?:\s|:|é){1,8}(\d[\d.\-]{7,17}))",
      std::regex::ECMAScript | std::regex::optimize);

  std::string folded = FoldCase(text);
  std::vector<Entity> found;

  auto capture = [&](PIIType type, size_t start, size_t end) {
    Entity entity;
    entity.type = type;
    entity.start = start;
    entity.end = end;
    entity.raw_value = text.substr(start, end - start);
    if (BlocksKeywordCapture(entity, existing, policy) ||
        BlocksKeywordCapture(entity, found, policy)) {
      return;
    }

    ValidationResult verdict = Validate(type, entity.raw_value);
    entity.normalized_value = verdict.normalized;
    entity.validation_status = StatusFor(type, verdict);
    entity.structurally_valid = verdict.structurally_valid;
    entity.base_confidence = kKeywordConfidence;
    entity.confidence = kKeywordConfidence;
    entity.sources = SOURCE_AFN;
    entity.reason = "afn_keyword";
    found.push_back(std::move(entity));
  };

  for (std::sregex_iterator it(folded.begin(), folded.end(), kPhoneAfterKeyword), end;
       it != end; ++it) {
    size_t start = static_cast<size_t>(it->position(1));
    capture(PIIType::PHONE, start, start + static_cast<size_t>(it->length(1)));
  }

  for (std::sregex_iterator it(folded.begin(), folded.end(), kCpfAfterKeyword), end;
       it != end; ++it) {
    size_t start = static_cast<size_t>(it->position(1));
    size_t stop = start + static_cast<size_t>(it->length(1));
    if (stop < text.size() && IsAsciiDigit(text[stop])) {
      continue;  // Longer digit run than a CPF can be
    }
    while (stop > start && IsTrailingSeparator(text[stop - 1])) {
      stop--;
    }
    if (DigitsOnly(text.substr(start, stop - start)).size() >= 9) {
      capture(PIIType::CPF, start, stop);
    }
  }

  std::sort(found.begin(), found.end(),
            [](const Entity& a, const Entity& b) { return a.start < b.start; });
  return found;
}

std::vector<Entity> AfnEscalator::AdmitLowered(const std::string& text,
                                               const std::vector<ContextualCandidate>& candidates,
                                               std::vector<Entity>& existing,
                                               double lowered_threshold) {
  std::vector<Entity> admitted;
  for (const auto& candidate : candidates) {
    if (candidate.confidence < lowered_threshold) {
      continue;
    }
    Entity entity = ToContextualEntity(candidate, text);

    bool known = false;
    for (auto& current : existing) {
      if ((current.sources & SOURCE_CONTEXTUAL) && current.type == entity.type &&
          FusionEngine::IsNearSameSpan(current, entity)) {
        if (current.acceptance_threshold < 0.0 ||
            current.acceptance_threshold > lowered_threshold) {
          current.acceptance_threshold = lowered_threshold;
        }
        known = true;
        break;
      }
    }
    if (known) {
      continue;
    }

    entity.acceptance_threshold = lowered_threshold;
    entity.reason = "afn_contextual";
    admitted.push_back(std::move(entity));
  }
  return admitted;
}

int AfnEscalator::ExpandContext(std::vector<Entity>& entities, const std::string& text,
                                double below) {
  int rescored = 0;
  for (auto& entity : entities) {
    if (entity.confidence >= below) {
      continue;
    }
    double before = entity.confidence;
    ConfidenceScorer::Score(entity, text, ConfidenceScorer::kExpandedContextWindow);
    if (entity.confidence > before) {
      rescored++;
    }
  }
  return rescored;
}

AfnOutcome AfnEscalator::Run(const std::string& text, const ModePolicy& policy,
                             std::vector<Entity>& entities, const ContextualRescan& rescan) {
  AfnOutcome outcome;

  size_t retained = static_cast<size_t>(std::count_if(
      entities.begin(), entities.end(),
      [&](const Entity& e) { return ShouldRetain(policy, e); }));
  if (!ShouldTrigger(policy, retained)) {
    return outcome;
  }
  outcome.triggered = true;

  std::vector<Entity> additions = NumericRescan(text, entities, policy.afn_min_confidence);
  outcome.numeric_added = static_cast<int>(additions.size());

  std::vector<Entity> known(entities);
  known.insert(known.end(), additions.begin(), additions.end());
  std::vector<Entity> keyworded = KeywordRescan(text, known, policy);
  outcome.keyword_added = static_cast<int>(keyworded.size());
  additions.insert(additions.end(), keyworded.begin(), keyworded.end());

  if (policy.afn_passes == AfnPasses::DOUBLE && rescan) {
    double lowered = policy.base_threshold / 2.0;
    RecognizeResponse response = rescan(lowered);
    outcome.contextual_rescan_ran = true;
    outcome.contextual_status = response.status;
    if (response.status == RecognizeStatus::OK) {
      std::vector<Entity> admitted = AdmitLowered(text, response.candidates, entities, lowered);
      outcome.contextual_added = static_cast<int>(admitted.size());
      additions.insert(additions.end(), admitted.begin(), admitted.end());
    } else {
      LOG_WARN("AfnEscalator", "Lowered-threshold rescan skipped: " +
               RecognizeStatusToString(response.status));
    }
  }

  if (!additions.empty()) {
    entities.insert(entities.end(), additions.begin(), additions.end());
    entities = FusionEngine::Fuse(std::move(entities));
  }

  ConfidenceScorer::ScoreAll(entities, text);
  outcome.rescored = ExpandContext(entities, text, policy.afn_min_confidence);

  LOG_DEBUG("AfnEscalator", "Escalation added " + std::to_string(outcome.numeric_added) +
            " numeric, " + std::to_string(outcome.keyword_added) + " keyword and " +
            std::to_string(outcome.contextual_added) +
            " contextual candidates, rescored " + std::to_string(outcome.rescored));
  return outcome;
}

}  // namespace GuardianPII
