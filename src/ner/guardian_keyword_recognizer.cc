#include "guardian_keyword_recognizer.h"
#include "guardian_text_utils.h"
#include "logger.h"
#include <algorithm>

namespace GuardianPII {

namespace {

struct Trigger {
  const char* phrase;  // Lowercase, matched against folded text
  double confidence;
};

const Trigger kNameTriggers[] = {
  {"meu nome é", 0.85},
  {"me chamo", 0.85},
  {"sr.", 0.80},
  {"sra.", 0.80},
  {"dr.", 0.80},
  {"dra.", 0.80},
  {"requerente", 0.75},
  {"solicitante", 0.75},
  {"nome:", 0.75},
};

const char* const kStreetWords[] = {
  "rua", "avenida", "av.", "travessa", "alameda", "praça", "rodovia", "estrada"
};

const char* const kBirthTriggers[] = {
  "nascimento", "nascido", "nascida", "data de nasc", "nasci em"
};

const char* const kOrgSuffixes[] = {
  "Ltda.", "Ltda", "LTDA", "S.A.", "S/A", "EIRELI", "ME"
};

const char* const kConnectors[] = {"da", "de", "do", "das", "dos", "e"};

constexpr double kAddressConfidence = 0.80;
constexpr double kBirthDateConfidence = 0.85;
constexpr double kOrgConfidence = 0.70;
constexpr size_t kBirthDateReach = 40;
constexpr int kMaxNameWords = 6;
constexpr int kMaxStreetWords = 8;
constexpr int kMaxOrgWords = 6;

bool IsWordByte(unsigned char c) {
  return IsAsciiAlpha(static_cast<char>(c)) || c >= 0x80;
}

size_t WordEnd(const std::string& text, size_t pos) {
  while (pos < text.size() && IsWordByte(static_cast<unsigned char>(text[pos]))) pos++;
  return pos;
}

bool StartsUpper(const std::string& text, size_t pos) {
  if (pos >= text.size()) return false;
  unsigned char c = static_cast<unsigned char>(text[pos]);
  if (IsAsciiUpper(static_cast<char>(c))) return true;
  if (c == 0xC3 && pos + 1 < text.size()) {
    unsigned char next = static_cast<unsigned char>(text[pos + 1]);
    return next >= 0x80 && next <= 0x9E && next != 0x97;
  }
  return false;
}

// "Silva", "Álvaro": capital first letter, no ASCII capitals after it
bool IsNameWord(const std::string& text, size_t begin, size_t end) {
  if (end - begin < 2 || !StartsUpper(text, begin)) return false;
  for (size_t i = begin + 1; i < end; ++i) {
    if (IsAsciiUpper(text[i])) return false;
  }
  return true;
}

// Capitalized, or all capitals as in company names
bool IsCapitalizedWord(const std::string& text, size_t begin, size_t end) {
  return end > begin && StartsUpper(text, begin);
}

bool IsConnector(const std::string& folded, size_t begin, size_t end) {
  std::string word = folded.substr(begin, end - begin);
  for (const char* connector : kConnectors) {
    if (word == connector) return true;
  }
  return false;
}

size_t SkipSpaces(const std::string& text, size_t pos) {
  while (pos < text.size() && text[pos] == ' ') pos++;
  return pos;
}

// True if |phrase| occurs at |pos| and does not continue a longer word
bool StartsWordAt(const std::string& folded, size_t pos) {
  return pos == 0 || !IsWordByte(static_cast<unsigned char>(folded[pos - 1]));
}

/**
 * Reads a run of name words starting at |pos|, allowing lowercase
 * connectors between them. Returns the number of name words and sets
 * |start|/|end| to the run's span.
 */
int ScanNameRun(const std::string& text, const std::string& folded, size_t pos,
                int max_words, size_t* start, size_t* end) {
  int words = 0;
  size_t cursor = SkipSpaces(text, pos);
  *start = cursor;
  *end = cursor;

  while (cursor < text.size() && words < max_words) {
    size_t word_end = WordEnd(text, cursor);
    if (word_end == cursor) break;

    if (IsNameWord(text, cursor, word_end)) {
      words++;
      *end = word_end;
    } else if (words > 0 && IsConnector(folded, cursor, word_end)) {
      // A connector only counts if another name word follows
      size_t next = SkipSpaces(text, word_end);
      size_t next_end = WordEnd(text, next);
      if (next == word_end || !IsNameWord(text, next, next_end)) break;
    } else {
      break;
    }

    size_t after = SkipSpaces(text, word_end);
    if (after == word_end) break;  // Punctuation ends the run
    cursor = after;
  }
  return words;
}

bool IsDateAt(const std::string& text, size_t pos) {
  if (pos + 10 > text.size()) return false;
  for (size_t i = 0; i < 10; ++i) {
    char c = text[pos + i];
    bool separator_slot = i == 2 || i == 5;
    if (separator_slot ? (c != '/' && c != '-' && c != '.') : !IsAsciiDigit(c)) {
      return false;
    }
  }
  if (text[pos + 2] != text[pos + 5]) return false;
  if (pos > 0 && IsAsciiDigit(text[pos - 1])) return false;
  if (pos + 10 < text.size() && IsAsciiDigit(text[pos + 10])) return false;

  int day = (text[pos] - '0') * 10 + (text[pos + 1] - '0');
  int month = (text[pos + 3] - '0') * 10 + (text[pos + 4] - '0');
  return day >= 1 && day <= 31 && month >= 1 && month <= 12;
}

}  // namespace

KeywordRecognizer::KeywordRecognizer(size_t max_length, size_t concurrency)
    : max_length_(max_length),
      concurrency_(std::max<size_t>(1, concurrency)) {}

void KeywordRecognizer::FindNames(const std::string& text, const std::string& folded,
                                  std::vector<ContextualCandidate>& out) const {
  for (const auto& trigger : kNameTriggers) {
    std::string phrase(trigger.phrase);
    for (size_t pos = folded.find(phrase); pos != std::string::npos;
         pos = folded.find(phrase, pos + 1)) {
      if (!StartsWordAt(folded, pos)) continue;

      size_t after = pos + phrase.size();
      // Letters right after a trigger word mean a longer word ("srta")
      if (IsAsciiAlpha(phrase.back()) && after < text.size() &&
          IsWordByte(static_cast<unsigned char>(text[after]))) {
        continue;
      }
      while (after < text.size() && (text[after] == ':' || text[after] == ',')) after++;

      size_t start = 0;
      size_t end = 0;
      int words = ScanNameRun(text, folded, after, kMaxNameWords, &start, &end);
      if (words >= 2) {
        out.push_back({PIIType::NAME, start, end, trigger.confidence});
      }
    }
  }
}

void KeywordRecognizer::FindAddresses(const std::string& text, const std::string& folded,
                                      std::vector<ContextualCandidate>& out) const {
  for (const char* street : kStreetWords) {
    std::string word(street);
    for (size_t pos = folded.find(word); pos != std::string::npos;
         pos = folded.find(word, pos + 1)) {
      size_t word_end = pos + word.size();
      if (!StartsWordAt(folded, pos) || word_end >= text.size() || text[word_end] != ' ') {
        continue;
      }

      size_t name_start = 0;
      size_t end = 0;
      int words = ScanNameRun(text, folded, word_end, kMaxStreetWords, &name_start, &end);
      if (words == 0) {
        // "Rua das Flores": the connector comes before the first name word
        size_t first = SkipSpaces(text, word_end);
        size_t first_end = WordEnd(text, first);
        if (first_end > first && IsConnector(folded, first, first_end)) {
          words = ScanNameRun(text, folded, first_end, kMaxStreetWords, &name_start, &end);
        }
      }
      if (words == 0) continue;

      // Optional house number: ", 123", " 123", ", nº 123"
      size_t cursor = end;
      if (cursor < text.size() && text[cursor] == ',') cursor++;
      cursor = SkipSpaces(text, cursor);
      for (const char* marker : {"nº", "n°", "n.", "número"}) {
        std::string m(marker);
        if (folded.compare(cursor, m.size(), m) == 0) {
          cursor = SkipSpaces(text, cursor + m.size());
          break;
        }
      }
      size_t digits_end = cursor;
      while (digits_end < text.size() && digits_end - cursor < 6 &&
             IsAsciiDigit(text[digits_end])) {
        digits_end++;
      }
      if (digits_end > cursor &&
          (digits_end == text.size() || !IsAsciiDigit(text[digits_end]))) {
        end = digits_end;
      }

      out.push_back({PIIType::ADDRESS, pos, end, kAddressConfidence});
    }
  }
}

void KeywordRecognizer::FindBirthDates(const std::string& text, const std::string& folded,
                                       std::vector<ContextualCandidate>& out) const {
  for (const char* trigger : kBirthTriggers) {
    std::string phrase(trigger);
    for (size_t pos = folded.find(phrase); pos != std::string::npos;
         pos = folded.find(phrase, pos + 1)) {
      if (!StartsWordAt(folded, pos)) continue;

      size_t from = pos + phrase.size();
      size_t limit = std::min(text.size(), from + kBirthDateReach);
      for (size_t i = from; i < limit; ++i) {
        if (IsDateAt(text, i)) {
          out.push_back({PIIType::BIRTH_DATE, i, i + 10, kBirthDateConfidence});
          break;
        }
      }
    }
  }
}

void KeywordRecognizer::FindOrganizations(const std::string& text,
                                          std::vector<ContextualCandidate>& out) const {
  for (const char* suffix : kOrgSuffixes) {
    std::string marker(suffix);
    for (size_t pos = text.find(marker); pos != std::string::npos;
         pos = text.find(marker, pos + 1)) {
      size_t end = pos + marker.size();
      if (pos == 0 || text[pos - 1] != ' ') continue;
      if (end < text.size() && IsWordByte(static_cast<unsigned char>(text[end]))) continue;

      // Walk back over capitalized words, connectors and '&'
      size_t start = pos;
      size_t cursor = pos;
      int words = 0;
      while (cursor > 0 && words < kMaxOrgWords) {
        size_t word_end = cursor;
        while (word_end > 0 && text[word_end - 1] == ' ') word_end--;
        size_t word_begin = word_end;
        while (word_begin > 0 &&
               (IsWordByte(static_cast<unsigned char>(text[word_begin - 1])) ||
                text[word_begin - 1] == '&')) {
          word_begin--;
        }
        if (word_begin == word_end || word_end == cursor) break;

        if (IsCapitalizedWord(text, word_begin, word_end)) {
          words++;
          start = word_begin;
        } else if (!(word_end - word_begin == 1 && text[word_begin] == '&')) {
          std::string folded = FoldCase(text.substr(word_begin, word_end - word_begin));
          if (!IsConnector(folded, 0, folded.size())) break;
        }
        cursor = word_begin;
      }
      if (words > 0) {
        out.push_back({PIIType::ORG, start, end, kOrgConfidence});
      }
    }
  }
}

RecognizeResponse KeywordRecognizer::Recognize(const RecognizeRequest& request) {
  RecognizeResponse response;

  size_t limit = max_length_;
  if (request.max_length > 0) limit = std::min(limit, request.max_length);
  std::string text = request.text.substr(0, Utf8SafePrefix(request.text, limit));
  std::string folded = FoldCase(text);

  std::vector<ContextualCandidate> found;
  FindNames(text, folded, found);
  FindAddresses(text, folded, found);
  FindBirthDates(text, folded, found);
  FindOrganizations(text, found);

  std::sort(found.begin(), found.end(), [](const ContextualCandidate& a,
                                           const ContextualCandidate& b) {
    if (a.start != b.start) return a.start < b.start;
    if (a.end != b.end) return a.end > b.end;
    return a.confidence > b.confidence;
  });

  // Overlapping rules: the first (earliest, longest) span wins unless a
  // later one is more confident
  for (const auto& candidate : found) {
    if (candidate.confidence < request.min_score) continue;
    if (!response.candidates.empty() && candidate.start < response.candidates.back().end) {
      if (candidate.confidence > response.candidates.back().confidence) {
        response.candidates.back() = candidate;
      }
      continue;
    }
    response.candidates.push_back(candidate);
  }

  LOG_DEBUG("KeywordRecognizer", "Found " + std::to_string(response.candidates.size()) +
            " contextual candidates");
  return response;
}

}  // namespace GuardianPII
