#include "ragkb_core/lang/stopword_language_detector.hpp"

#include <utf8.h>

#include <iterator>
#include <map>

#include "ragkb_core/errors.hpp"
#include "ragkb_core/text/utf8_text.hpp"

namespace ragkb_core {

StopwordLanguageDetector::StopwordLanguageDetector()
    : StopwordLanguageDetector(default_profiles()) {}

StopwordLanguageDetector::StopwordLanguageDetector(std::vector<Profile> latin_profiles)
    : latin_profiles_(std::move(latin_profiles)) {}

std::vector<StopwordLanguageDetector::Profile> StopwordLanguageDetector::default_profiles() {
  return {
      {"en", {"the", "and", "is", "are", "was", "of", "to", "in", "that", "it", "with", "for",
              "on", "be", "this", "what", "how", "which", "who", "does", "do", "from", "not",
              "have", "has", "an", "or", "can", "why", "where", "when"}},
      {"es", {"el", "la", "los", "las", "de", "que", "y", "en", "es", "por", "para", "con",
              "una", "un", "del", "qué", "cómo", "cuál", "se", "al", "lo", "como", "está",
              "son", "dónde", "cuándo", "pero", "su"}},
      {"fr", {"le", "la", "les", "des", "est", "et", "un", "une", "du", "qui", "dans", "pour",
              "pas", "sur", "avec", "ce", "sont", "quel", "quelle", "comment", "il", "je",
              "vous", "nous", "au", "aux", "où", "pourquoi"}},
      {"de", {"der", "die", "das", "und", "ist", "nicht", "ein", "eine", "zu", "den", "dem",
              "mit", "von", "für", "auf", "was", "wie", "ich", "sie", "es", "sind", "im",
              "auch", "wird", "warum", "wo", "welche"}},
      {"it", {"il", "lo", "gli", "la", "di", "che", "è", "e", "un", "una", "per", "con", "non",
              "sono", "come", "cosa", "del", "della", "nel", "anche", "questo", "quale",
              "perché", "dove"}},
      {"pt", {"o", "os", "as", "de", "que", "e", "é", "um", "uma", "não", "com", "para", "por",
              "do", "da", "dos", "das", "em", "como", "são", "qual", "no", "na", "se", "onde",
              "porque"}},
      {"nl", {"de", "het", "een", "en", "is", "van", "dat", "niet", "op", "te", "zijn", "met",
              "voor", "wat", "hoe", "er", "ik", "ook", "maar", "welke", "wordt", "waar",
              "waarom"}},
  };
}

StopwordLanguageDetector::Script StopwordLanguageDetector::classify(uint32_t cp) {
  if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) return Script::Latin;
  if (cp >= 0x00C0 && cp <= 0x024F && cp != 0x00D7 && cp != 0x00F7) return Script::Latin;
  if ((cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF)) return Script::Han;
  if (cp >= 0x3040 && cp <= 0x30FF) return Script::Kana;
  if ((cp >= 0xAC00 && cp <= 0xD7AF) || (cp >= 0x1100 && cp <= 0x11FF) ||
      (cp >= 0x3130 && cp <= 0x318F))
    return Script::Hangul;
  if (cp >= 0x0400 && cp <= 0x04FF) return Script::Cyrillic;
  if ((cp >= 0x0600 && cp <= 0x06FF) || (cp >= 0x0750 && cp <= 0x077F)) return Script::Arabic;
  if (cp >= 0x0370 && cp <= 0x03FF) return Script::Greek;
  if (cp >= 0x05D0 && cp <= 0x05EA) return Script::Hebrew;
  if (cp >= 0x0900 && cp <= 0x097F) return Script::Devanagari;
  if (cp >= 0x0E01 && cp <= 0x0E5B) return Script::Thai;
  return Script::None;
}

// і ї є ґ in either case
bool StopwordLanguageDetector::is_ukrainian_marker(uint32_t cp) {
  return cp == 0x0456 || cp == 0x0406 || cp == 0x0457 || cp == 0x0407 || cp == 0x0454 ||
         cp == 0x0404 || cp == 0x0491 || cp == 0x0490;
}

// پ چ ژ گ
bool StopwordLanguageDetector::is_persian_marker(uint32_t cp) {
  return cp == 0x067E || cp == 0x0686 || cp == 0x0698 || cp == 0x06AF;
}

std::string StopwordLanguageDetector::detect(const std::string &text) const {
  std::string clean = text;
  sanitize_utf8(clean);

  std::map<Script, size_t> script_counts;
  bool ukrainian_marker = false;
  bool persian_marker = false;
  std::vector<std::string> latin_words;
  std::string current_word;

  auto it = clean.begin();
  while (it != clean.end()) {
    const uint32_t cp = utf8::next(it, clean.end());
    const Script script = classify(cp);

    if (script == Script::Latin) {
      // Stopword lists are lowercase; only ASCII letters are folded
      const uint32_t lowered = (cp >= 'A' && cp <= 'Z') ? cp + ('a' - 'A') : cp;
      utf8::append(lowered, std::back_inserter(current_word));
    } else if (!current_word.empty()) {
      latin_words.push_back(std::move(current_word));
      current_word.clear();
    }

    if (script == Script::None) {
      continue;
    }
    ++script_counts[script];
    ukrainian_marker = ukrainian_marker || is_ukrainian_marker(cp);
    persian_marker = persian_marker || is_persian_marker(cp);
  }
  if (!current_word.empty()) {
    latin_words.push_back(std::move(current_word));
  }

  if (script_counts.empty()) {
    throw LanguageDetectionError("No letters to detect a language from");
  }

  // Any kana means Japanese, even when kanji dominate
  if (script_counts.count(Script::Kana) > 0) {
    return "ja";
  }

  Script dominant = Script::None;
  size_t best = 0;
  for (const auto &[script, count] : script_counts) {
    if (count > best) {
      dominant = script;
      best = count;
    }
  }

  switch (dominant) {
    case Script::Latin:
      return detect_latin(latin_words);
    case Script::Han:
      return "zh-cn";
    case Script::Hangul:
      return "ko";
    case Script::Cyrillic:
      return ukrainian_marker ? "uk" : "ru";
    case Script::Arabic:
      return persian_marker ? "fa" : "ar";
    case Script::Greek:
      return "el";
    case Script::Hebrew:
      return "he";
    case Script::Devanagari:
      return "hi";
    case Script::Thai:
      return "th";
    default:
      throw LanguageDetectionError("No letters to detect a language from");
  }
}

std::string StopwordLanguageDetector::detect_latin(const std::vector<std::string> &words) const {
  const Profile *best_profile = nullptr;
  size_t best_hits = 0;

  for (const auto &profile : latin_profiles_) {
    size_t hits = 0;
    for (const auto &word : words) {
      if (profile.stopwords.count(word) > 0) {
        ++hits;
      }
    }
    if (hits > best_hits) {
      best_hits = hits;
      best_profile = &profile;
    }
  }

  if (!best_profile) {
    throw LanguageDetectionError("No known words in text, cannot tell its language");
  }
  return best_profile->code;
}

}  // namespace ragkb_core
