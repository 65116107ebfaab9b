#include "tokenizer.hpp"

namespace nbayes {

namespace {

inline bool IsContinuationByte(const unsigned char ch) {
  return (ch & 0xc0) == 0x80;
}

// Decodes the UTF-8 sequence starting at text[pos]. Returns its length in
// bytes, or 0 if the bytes there are not a well-formed sequence.
int DecodeUtf8(const string& text, const size_t pos, uint32_t* code_point) {
  const unsigned char lead = text[pos];
  int len = 0;
  uint32_t cp = 0;
  if (lead >= 0xc2 && lead <= 0xdf) {
    len = 2;
    cp = lead & 0x1f;
  } else if (lead >= 0xe0 && lead <= 0xef) {
    len = 3;
    cp = lead & 0x0f;
  } else if (lead >= 0xf0 && lead <= 0xf4) {
    len = 4;
    cp = lead & 0x07;
  } else {
    return 0;
  }
  if (pos + len > text.size()) {
    return 0;
  }
  for (int i = 1; i < len; ++i) {
    const unsigned char ch = text[pos + i];
    if (!IsContinuationByte(ch)) {
      return 0;
    }
    cp = (cp << 6) | (ch & 0x3f);
  }
  *code_point = cp;
  return len;
}

inline void FlushToken(string* current, TokenVec* tokens) {
  if (!current->empty()) {
    tokens->push_back(*current);
    current->clear();
  }
}

} // namespace

bool Tokenizer::IsSeparatorCodePoint(const uint32_t code_point) {
  return (code_point >= 0x80 && code_point <= 0xbf)       // C1, Latin-1 punct
      || code_point == 0xd7 || code_point == 0xf7         // multiply, divide
      || (code_point >= 0x2000 && code_point <= 0x206f)   // general punct
      || (code_point >= 0x3000 && code_point <= 0x303f)   // CJK punct
      || code_point == 0xfeff;                            // BOM
}

TokenVec Tokenizer::Tokenize(const string& text) {
  TokenVec tokens;
  Tokenize(text, &tokens);
  return tokens;
}

void Tokenizer::Tokenize(const string& text, TokenVec* tokens) {
  CHECK(tokens != NULL);
  string current;
  size_t i = 0;
  while (i < text.size()) {
    const unsigned char ch = text[i];
    if (ch >= 0x80) {
      uint32_t code_point = 0;
      const int len = DecodeUtf8(text, i, &code_point);
      if (len == 0) {
        // stray byte of malformed input: keep it as part of the word
        current.push_back(ch);
        ++i;
      } else if (IsSeparatorCodePoint(code_point)) {
        FlushToken(&current, tokens);
        i += len;
      } else {
        current.append(text, i, len);
        i += len;
      }
      continue;
    }
    // punctuation (including '_') is removed and ends the current word
    if (std::ispunct(ch) || !IsWordChar(ch)) {
      FlushToken(&current, tokens);
    } else {
      current.push_back(std::tolower(ch));
    }
    ++i;
  }
  FlushToken(&current, tokens);
}

} // namespace nbayes
