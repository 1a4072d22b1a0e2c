#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled. Returns an empty string if the
// command cannot be found. Commands containing a '/' are returned unchanged
// if they exist.
std::string which(const std::string& cmd, bool use_cache = true);

// Like which, but looks cmd up in the given colon-separated list of
// directories instead of PATH. Not cached.
std::string which_in(const std::string& cmd, const std::string& search_path);

}  // namespace util

#endif
