#ifndef SMARTCMD_CORE_TOKENIZER_H_
#define SMARTCMD_CORE_TOKENIZER_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace smartcmd {

struct Token {
  std::string text;  // Content with quote characters removed.
  size_t start = 0;  // Byte offset of the first character (an opening quote included).
  size_t end = 0;    // Byte offset one past the last character.
  bool unterminated_quote = false;
};

// Splits `line` on whitespace outside of single or double quotes. A quote left open extends its
// token to the end of the input.
std::vector<Token> Tokenize(std::string_view line);

// What the cursor position means for completion.
struct InputContext {
  std::vector<std::string> completed;  // Tokens that drive tree descent.
  std::string partial;                 // Filter prefix; empty after trailing whitespace.
  size_t partial_start = 0;            // Where a suggestion for `partial` starts replacing.
  size_t cursor = 0;                   // Cursor clamped to the line length.
};

// Only the text before `cursor` is considered; a token under the cursor is cut at the cursor.
InputContext ResolveInputContext(std::string_view line, size_t cursor);

}  // namespace smartcmd

#endif  // SMARTCMD_CORE_TOKENIZER_H_
