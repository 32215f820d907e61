#ifndef GUARDIAN_TEXT_UTILS_H_
#define GUARDIAN_TEXT_UTILS_H_

#include <cstddef>
#include <string>

// Byte-level helpers for UTF-8 text. Offsets are byte offsets unless a
// function says it counts characters.
namespace GuardianPII {

// True if |text| is well-formed UTF-8 (no overlongs, surrogates or
// code points above U+10FFFF).
bool IsValidUtf8(const std::string& text);

// True if |text| holds only ASCII whitespace.
bool IsBlank(const std::string& text);

// Largest prefix length <= max_bytes that does not split a UTF-8 sequence.
size_t Utf8SafePrefix(const std::string& text, size_t max_bytes);

// Largest offset <= pos that starts a UTF-8 sequence (or is text.size()).
size_t Utf8FloorBoundary(const std::string& text, size_t pos);

// Smallest offset >= pos that starts a UTF-8 sequence (or is text.size()).
size_t Utf8CeilBoundary(const std::string& text, size_t pos);

// Number of characters (code points) in the first |pos| bytes of |text|.
// |pos| is clamped to text.size().
size_t Utf8CharCount(const std::string& text, size_t pos);

// Byte offset reached by moving |chars| characters back from |pos|,
// stopping at 0.
size_t Utf8Retreat(const std::string& text, size_t pos, size_t chars);

// Byte offset reached by moving |chars| characters forward from |pos|,
// stopping at text.size().
size_t Utf8Advance(const std::string& text, size_t pos, size_t chars);

// Lowercases ASCII letters and the Latin-1 uppercase block encoded as
// two-byte UTF-8 (U+00C0..U+00DE), leaving everything else untouched.
// Byte length is preserved.
std::string FoldCase(const std::string& text);

// Keeps only ASCII digits
std::string DigitsOnly(const std::string& text);

inline bool IsAsciiDigit(char c) { return c >= '0' && c <= '9'; }

inline bool IsAsciiUpper(char c) { return c >= 'A' && c <= 'Z'; }

inline bool IsAsciiAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

}  // namespace GuardianPII

#endif  // GUARDIAN_TEXT_UTILS_H_
