#include "core/tokenizer.h"

#include <algorithm>

#include "absl/strings/ascii.h"

namespace smartcmd {

std::vector<Token> Tokenize(std::string_view line) {
  std::vector<Token> tokens;
  Token current;
  bool in_token = false;
  char quote = '\0';

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      } else {
        current.text.push_back(c);
      }
      continue;
    }
    if (absl::ascii_isspace(static_cast<unsigned char>(c))) {
      if (in_token) {
        current.end = i;
        tokens.push_back(std::move(current));
        current = Token();
        in_token = false;
      }
      continue;
    }
    if (!in_token) {
      current.start = i;
      in_token = true;
    }
    if (c == '\'' || c == '"') {
      quote = c;
    } else {
      current.text.push_back(c);
    }
  }

  if (in_token) {
    current.end = line.size();
    current.unterminated_quote = quote != '\0';
    tokens.push_back(std::move(current));
  }
  return tokens;
}

InputContext ResolveInputContext(std::string_view line, size_t cursor) {
  InputContext ctx;
  ctx.cursor = std::min(cursor, line.size());
  std::vector<Token> tokens = Tokenize(line.substr(0, ctx.cursor));

  // A token that reaches the cursor is still being typed.
  if (!tokens.empty() && tokens.back().end == ctx.cursor) {
    ctx.partial = std::move(tokens.back().text);
    ctx.partial_start = tokens.back().start;
    tokens.pop_back();
  } else {
    ctx.partial_start = ctx.cursor;
  }

  ctx.completed.reserve(tokens.size());
  for (auto& token : tokens) {
    ctx.completed.push_back(std::move(token.text));
  }
  return ctx;
}

}  // namespace smartcmd
