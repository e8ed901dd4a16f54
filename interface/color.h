#ifndef SMARTCMD_INTERFACE_COLOR_H_
#define SMARTCMD_INTERFACE_COLOR_H_

#include <string>
#include <string_view>

namespace icons {
constexpr const char* Error = "❌";
constexpr const char* Info = "ℹ️";
constexpr const char* Search = "🔍";
constexpr const char* Example = "💡";
constexpr const char* Prompt = "❯";
}  // namespace icons

namespace ansi {
// Reset code
constexpr const char* Reset = "\033[0m";

// Text style
constexpr const char* Bold = "\033[1m";

// Foreground (text) color
constexpr const char* White = "\033[37m";
constexpr const char* Cyan = "\033[36m";
constexpr const char* Grey = "\033[90m";
constexpr const char* Green = "\033[32m";
constexpr const char* Yellow = "\033[33m";
constexpr const char* Magenta = "\033[35m";
constexpr const char* Metadata = Grey;
constexpr const char* Logo = Cyan;
constexpr const char* Index = Yellow;
constexpr const char* FieldLabel = Magenta;
constexpr const char* Invocation = Green;
}  // namespace ansi

namespace smartcmd {

inline std::string Colorize(const std::string& text, const char* bg_background,
                            const char* fg_foreground = ansi::White) {
  return std::string(bg_background) + std::string(fg_foreground) + text + ansi::Reset;
}

/**
 * @brief Calculates the printable length of a string, excluding ANSI escape codes.
 *
 * Counts UTF-8 start bytes only and skips SGR sequences, so the result is the number of columns
 * the string occupies for single-width characters.
 */
inline size_t VisibleLength(std::string_view s) {
  size_t len = 0;
  for (size_t i = 0; i < s.length(); ++i) {
    if (s[i] == '\033' && i + 1 < s.length() && s[i + 1] == '[') {
      i += 2;
      while (i < s.length() && (s[i] < 0x40 || s[i] > 0x7E)) {
        i++;
      }
    } else if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
      len++;
    }
  }
  return len;
}

}  // namespace smartcmd

#endif  // SMARTCMD_INTERFACE_COLOR_H_
