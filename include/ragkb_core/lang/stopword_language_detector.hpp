#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "ragkb_core/lang/language_detector.hpp"

namespace ragkb_core {

/**
 * @class StopwordLanguageDetector
 * @brief Detects the language of short texts such as search queries.
 *
 * Texts written mostly in a non-Latin script are classified by the script
 * itself (with a few marker letters separating ru/uk and ar/fa). Latin-script
 * texts are scored against per-language stopword lists; the language with the
 * most stopword hits wins, earlier profiles winning ties.
 */
class StopwordLanguageDetector : public LanguageDetector {
 public:
  struct Profile {
    std::string code;
    std::unordered_set<std::string> stopwords;
  };

  StopwordLanguageDetector();
  explicit StopwordLanguageDetector(std::vector<Profile> latin_profiles);

  std::string detect(const std::string &text) const override;

  static std::vector<Profile> default_profiles();

 private:
  enum class Script { None, Latin, Han, Kana, Hangul, Cyrillic, Arabic, Greek, Hebrew, Devanagari, Thai };

  static Script classify(uint32_t code_point);
  static bool is_ukrainian_marker(uint32_t code_point);
  static bool is_persian_marker(uint32_t code_point);

  std::string detect_latin(const std::vector<std::string> &words) const;

  std::vector<Profile> latin_profiles_;
};

}  // namespace ragkb_core
