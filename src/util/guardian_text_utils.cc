#include "guardian_text_utils.h"
#include <algorithm>

namespace GuardianPII {

namespace {

inline bool IsContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

}  // namespace

bool IsValidUtf8(const std::string& text) {
  const auto* s = reinterpret_cast<const unsigned char*>(text.data());
  size_t n = text.size();
  size_t i = 0;

  while (i < n) {
    unsigned char c = s[i];
    if (c < 0x80) {
      i++;
      continue;
    }

    size_t len;
    unsigned int cp;
    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
      cp = c & 0x1F;
    } else if (c >= 0xE0 && c <= 0xEF) {
      len = 3;
      cp = c & 0x0F;
    } else if (c >= 0xF0 && c <= 0xF4) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (i + len > n) {
      return false;
    }
    for (size_t k = 1; k < len; ++k) {
      if (!IsContinuation(s[i + k])) {
        return false;
      }
      cp = (cp << 6) | (s[i + k] & 0x3F);
    }

    if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
        cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += len;
  }
  return true;
}

bool IsBlank(const std::string& text) {
  for (char c : text) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v') {
      return false;
    }
  }
  return true;
}

size_t Utf8FloorBoundary(const std::string& text, size_t pos) {
  if (pos >= text.size()) {
    return text.size();
  }
  while (pos > 0 && IsContinuation(static_cast<unsigned char>(text[pos]))) {
    pos--;
  }
  return pos;
}

size_t Utf8CeilBoundary(const std::string& text, size_t pos) {
  while (pos < text.size() && IsContinuation(static_cast<unsigned char>(text[pos]))) {
    pos++;
  }
  return pos < text.size() ? pos : text.size();
}

size_t Utf8SafePrefix(const std::string& text, size_t max_bytes) {
  if (max_bytes >= text.size()) {
    return text.size();
  }
  return Utf8FloorBoundary(text, max_bytes);
}

size_t Utf8CharCount(const std::string& text, size_t pos) {
  pos = std::min(pos, text.size());
  size_t count = 0;
  for (size_t i = 0; i < pos; ++i) {
    if (!IsContinuation(static_cast<unsigned char>(text[i]))) {
      count++;
    }
  }
  return count;
}

size_t Utf8Retreat(const std::string& text, size_t pos, size_t chars) {
  pos = Utf8FloorBoundary(text, pos);
  while (chars > 0 && pos > 0) {
    pos = Utf8FloorBoundary(text, pos - 1);
    chars--;
  }
  return pos;
}

size_t Utf8Advance(const std::string& text, size_t pos, size_t chars) {
  pos = Utf8CeilBoundary(text, pos);
  while (chars > 0 && pos < text.size()) {
    pos = Utf8CeilBoundary(text, pos + 1);
    chars--;
  }
  return pos;
}

std::string FoldCase(const std::string& text) {
  std::string out(text);
  for (size_t i = 0; i < out.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(out[i]);
    if (c >= 'A' && c <= 'Z') {
      out[i] = static_cast<char>(c + 0x20);
    } else if (c == 0xC3 && i + 1 < out.size()) {
      unsigned char next = static_cast<unsigned char>(out[i + 1]);
      // U+00C0..U+00DE except U+00D7 (multiplication sign)
      if (next >= 0x80 && next <= 0x9E && next != 0x97) {
        out[i + 1] = static_cast<char>(next + 0x20);
      }
      i++;
    }
  }
  return out;
}

std::string DigitsOnly(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (IsAsciiDigit(c)) {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace GuardianPII
