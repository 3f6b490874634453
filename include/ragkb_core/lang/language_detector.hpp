#pragma once

#include <string>

namespace ragkb_core {

class LanguageDetector {
 public:
  virtual ~LanguageDetector() = default;

  // Returns a language code such as "en" or "zh-cn". Throws
  // LanguageDetectionError when the text gives nothing to go on.
  virtual std::string detect(const std::string &text) const = 0;
};

}  // namespace ragkb_core
