#ifndef SMARTCMD_CORE_LOCALIZATION_H_
#define SMARTCMD_CORE_LOCALIZATION_H_

#include <string>
#include <string_view>

#include "core/command_spec.h"

namespace smartcmd {

// Language used when a mapping has no entry for the requested code.
inline constexpr char kDefaultLanguage[] = "en";

// Resolves `text` for `lang`. A single string is returned as is; a mapping yields the exact-code
// entry, else the kDefaultLanguage entry, else its lexicographically-first entry, else "".
const std::string& ResolveText(const LocalizedText& text, std::string_view lang);

// Reduces a locale or language tag to its primary language code:
// "zh_CN.UTF-8" -> "zh", "EN-us" -> "en". Returns kDefaultLanguage for "", "C" and "POSIX".
std::string NormalizeLanguageCode(std::string_view tag);

}  // namespace smartcmd

#endif  // SMARTCMD_CORE_LOCALIZATION_H_
