#ifndef NBAYES_TOKENIZER_HPP_
#define NBAYES_TOKENIZER_HPP_

#include "common.hpp"
#include <cctype>
#include <cstdint>

namespace nbayes {

// Splits raw text into lowercase word tokens. ASCII punctuation is dropped and
// separates tokens. Multi-byte UTF-8 characters stay whole: letters are kept
// inside a word, while Unicode spaces and punctuation (no-break space, curly
// quotes, ellipsis, CJK punctuation, ...) separate words like ASCII ones do.
class Tokenizer {
 public:
  static TokenVec Tokenize(const string& text);

  // Appends to tokens instead of returning a fresh vector.
  static void Tokenize(const string& text, TokenVec* tokens);

  static inline bool IsWordChar(const unsigned char ch) {
    return ch >= 0x80 || std::isalnum(ch) || ch == '_';
  }

  // Non-ASCII code points treated as separators.
  static bool IsSeparatorCodePoint(const uint32_t code_point);
};

} // namespace nbayes

#endif
