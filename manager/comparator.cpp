#include "manager/comparator.hpp"

#include "absl/strings/match.h"

namespace manager {

std::string StripTrailingNewline(const std::string& text) {
  if (absl::EndsWith(text, "\r\n")) return text.substr(0, text.size() - 2);
  if (absl::EndsWith(text, "\n")) return text.substr(0, text.size() - 1);
  return text;
}

bool CompareOutputs(const std::string& actual, const std::string& expected) {
  return StripTrailingNewline(actual) == StripTrailingNewline(expected);
}

}  // namespace manager
