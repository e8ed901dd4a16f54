#include "core/localization.h"

#include "absl/base/no_destructor.h"
#include "absl/strings/ascii.h"

namespace smartcmd {

const std::string& ResolveText(const LocalizedText& text, std::string_view lang) {
  static const absl::NoDestructor<std::string> kEmpty;

  if (const auto* single = std::get_if<std::string>(&text)) {
    return *single;
  }
  const auto& by_lang = std::get<LanguageMap>(text);
  if (auto it = by_lang.find(std::string(lang)); it != by_lang.end()) {
    return it->second;
  }
  if (auto it = by_lang.find(kDefaultLanguage); it != by_lang.end()) {
    return it->second;
  }
  if (!by_lang.empty()) {
    return by_lang.begin()->second;
  }
  return *kEmpty;
}

std::string NormalizeLanguageCode(std::string_view tag) {
  std::string_view primary = tag.substr(0, tag.find_first_of("_-.@"));
  if (primary.empty() || primary == "C" || primary == "POSIX") {
    return kDefaultLanguage;
  }
  return absl::AsciiStrToLower(primary);
}

}  // namespace smartcmd
