#include "guardian_pattern_library.h"
#include "logger.h"
#include <algorithm>
#include <tuple>

namespace GuardianPII {

const GuardianPatternLibrary& GuardianPatternLibrary::GetInstance() {
  static const GuardianPatternLibrary instance;
  return instance;
}

GuardianPatternLibrary::GuardianPatternLibrary() {
  InitializePatterns();
  LOG_DEBUG("PatternLibrary", "Compiled " + std::to_string(patterns_.size()) + " matchers");
}

void GuardianPatternLibrary::AddPattern(PIIType type, const char* expression,
                                        double base_confidence,
                                        AggressiveRegex min_tier) {
  int index = 0;
  for (const auto& p : patterns_) {
    if (p.type == type) index++;
  }
  patterns_.push_back({type, std::regex(expression, std::regex::ECMAScript | std::regex::optimize),
                       base_confidence, min_tier, index});
}

void GuardianPatternLibrary::InitializePatterns() {
  // CPF - 123.456.789-09, then looser separators, then bare 11-digit runs
  AddPattern(PIIType::CPF, R"(\b\d{3}\.\d{3}\.\d{3}-\d{2}\b)", 0.90);
  AddPattern(PIIType::CPF, R"(\b\d{3}[.\s]\d{3}[.\s]\d{3}[-./\s]\d{2}\b)", 0.85);
  AddPattern(PIIType::CPF, R"(\b\d{11}\b)", 0.70, AggressiveRegex::PARTIAL);

  // CNPJ - 11.222.333/0001-81 or any subset of its separators
  AddPattern(PIIType::CNPJ, R"(\b\d{2}\.\d{3}\.\d{3}/\d{4}-\d{2}\b)", 0.90);
  AddPattern(PIIType::CNPJ, R"(\b\d{2}\.?\d{3}\.?\d{3}/?\d{4}-?\d{2}\b)", 0.85);

  // Phone - optional +55, DDD with optional parentheses, mobile or landline
  AddPattern(PIIType::PHONE,
             R"((?:\+?55\s?)?(?:\(\d{2}\)|\b\d{2})\s?9\d{4}[-.\s]?\d{4}\b)", 0.90);
  AddPattern(PIIType::PHONE,
             R"((?:\+?55\s?)?(?:\(\d{2}\)|\b\d{2})\s?\d{4}[-.\s]?\d{4}\b)", 0.90);
  // Local number with no area code
  AddPattern(PIIType::PHONE, R"(\b9?\d{4}-\d{4}\b)", 0.70, AggressiveRegex::ON);

  // Email
  AddPattern(PIIType::EMAIL,
             R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9-]{1,63}(?:\.[A-Za-z0-9-]{1,63}){0,8}\.[A-Za-z]{2,24}\b)",
             0.90);

  // CEP - 01310-100, 01.310-100, then bare 8-digit runs
  AddPattern(PIIType::CEP, R"(\b\d{5}-\d{3}\b)", 0.90);
  AddPattern(PIIType::CEP, R"(\b\d{2}\.\d{3}-\d{3}\b)", 0.85);
  AddPattern(PIIType::CEP, R"(\b\d{8}\b)", 0.70, AggressiveRegex::PARTIAL);

  // RG - 12.345.678-9 with optional X check character, or state-prefixed
  AddPattern(PIIType::RG, R"(\b[A-Z]{2}-\d{1,2}\.\d{3}\.\d{3}\b)", 0.85);
  AddPattern(PIIType::RG, R"(\b\d{1,2}\.\d{3}\.\d{3}-?[\dXx]\b)", 0.80);

  // CNH - bare 11 digits, sometimes grouped 3-3-3-2 with spaces. Same score
  // as the bare CPF matcher: a run passing both checksums falls to the type
  // order tie-break and stays a CPF.
  AddPattern(PIIType::CNH, R"(\b\d{11}\b)", 0.70, AggressiveRegex::PARTIAL);
  AddPattern(PIIType::CNH, R"(\b\d{3} \d{3} \d{3} \d{2}\b)", 0.70, AggressiveRegex::PARTIAL);

  // PIS/PASEP - 170.33259.50-4
  AddPattern(PIIType::PIS_PASEP, R"(\b\d{3}\.\d{5}\.\d{2}-?\d\b)", 0.85);

  // Titulo de eleitor - 12 digits, grouped 4-4-4 or bare
  AddPattern(PIIType::VOTER_ID, R"(\b\d{4} \d{4} \d{4}\b)", 0.80);
  AddPattern(PIIType::VOTER_ID, R"(\b\d{12}\b)", 0.70, AggressiveRegex::PARTIAL);

  // Card - Visa, Mastercard, Discover and Amex prefixes in 4-digit groups
  AddPattern(PIIType::CREDIT_CARD,
             R"(\b(?:4\d{3}|5[1-5]\d{2}|6011|3[47]\d{2})[-.\s]?\d{4}[-.\s]?\d{4}[-.\s]?\d{4}\b)",
             0.90);

  // Vehicle plate - ABC-1234 and the Mercosul ABC1D23, upper case only
  AddPattern(PIIType::VEHICLE_PLATE, R"(\b[A-Z]{3}-?\d{4}\b)", 0.80);
  AddPattern(PIIType::VEHICLE_PLATE, R"(\b[A-Z]{3}\d[A-Z]\d{2}\b)", 0.85);

  // Passport - two letters and six digits
  AddPattern(PIIType::PASSPORT, R"(\b[A-Z]{2}\d{6}\b)", 0.70);
}

bool GuardianPatternLibrary::IsMasked(const std::string& text, size_t start, size_t end) {
  return (start > 0 && text[start - 1] == '*') ||
         (end < text.size() && text[end] == '*');
}

std::vector<RawCandidate> GuardianPatternLibrary::Extract(const std::string& text,
                                                          AggressiveRegex tier) const {
  std::vector<RawCandidate> candidates;
  int masked = 0;

  for (const auto& pattern : patterns_) {
    if (static_cast<int>(pattern.min_tier) > static_cast<int>(tier)) {
      continue;
    }

    auto begin = std::sregex_iterator(text.begin(), text.end(), pattern.regex);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
      const std::smatch& match = *it;
      if (match.length(0) == 0) {
        continue;
      }
      size_t start = static_cast<size_t>(match.position(0));
      size_t stop = start + static_cast<size_t>(match.length(0));
      if (IsMasked(text, start, stop)) {
        masked++;
        continue;
      }

      RawCandidate candidate;
      candidate.type = pattern.type;
      candidate.raw_value = match.str(0);
      candidate.start = start;
      candidate.end = stop;
      candidate.base_confidence = pattern.base_confidence;
      candidate.pattern_index = pattern.index;
      candidates.push_back(std::move(candidate));
    }
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const RawCandidate& a, const RawCandidate& b) {
              return std::make_tuple(a.start, static_cast<int>(a.type), a.pattern_index, a.end) <
                     std::make_tuple(b.start, static_cast<int>(b.type), b.pattern_index, b.end);
            });

  // The first matcher to claim a (type, start, end) span keeps it
  std::vector<RawCandidate> unique;
  unique.reserve(candidates.size());
  for (auto& candidate : candidates) {
    bool duplicate = false;
    for (auto it = unique.rbegin(); it != unique.rend() && it->start == candidate.start; ++it) {
      if (it->type == candidate.type && it->end == candidate.end) {
        duplicate = true;
        break;
      }
    }
    if (!duplicate) {
      unique.push_back(std::move(candidate));
    }
  }

  if (masked > 0) {
    LOG_DEBUG("PatternLibrary", "Skipped " + std::to_string(masked) + " masked matches");
  }
  return unique;
}

}  // namespace GuardianPII
