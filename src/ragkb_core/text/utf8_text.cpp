#include "ragkb_core/text/utf8_text.hpp"

#include <utf8.h>

#include <iterator>

namespace ragkb_core {

std::string truncate_code_points(const std::string &text, size_t max_code_points) {
  auto it = text.begin();
  size_t taken = 0;
  while (it != text.end() && taken < max_code_points) {
    utf8::next(it, text.end());
    ++taken;
  }
  return std::string(text.begin(), it);
}

size_t count_code_points(const std::string &text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

bool sanitize_utf8(std::string &text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return false;
  }
  std::string cleaned;
  cleaned.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(cleaned));
  text = std::move(cleaned);
  return true;
}

}  // namespace ragkb_core
