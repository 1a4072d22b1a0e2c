#ifndef MANAGER_COMPARATOR_HPP
#define MANAGER_COMPARATOR_HPP

#include <string>

namespace manager {

// Removes at most one trailing "\n" from text, together with the "\r" that
// precedes it, if any.
std::string StripTrailingNewline(const std::string& text);

// Whether the output of a program matches the expected one. Only a single
// trailing newline is ignored on each side; all other whitespace counts.
bool CompareOutputs(const std::string& actual, const std::string& expected);

}  // namespace manager

#endif
