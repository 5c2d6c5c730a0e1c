#pragma once

#include <string>

namespace swiv {

// Strip `base` from the front of `pathname`. Returns `pathname` unchanged when
// it does not start with `base`. Purely textual: no `..` handling.
std::string relative_to(const std::string& base, const std::string& pathname);

// Concatenate two segments with exactly one '/' between them
std::string join(const std::string& a, const std::string& b);

// Decode %XX escapes and '+' (query values). Malformed escapes are kept as-is.
std::string url_decode(const std::string& s, bool plus_as_space = false);

// Percent-encode a path for use in href/src attributes ('/' is kept)
std::string url_encode_path(const std::string& path);

// True if `path` equals `base` or lies below it (component-aware)
bool is_within(const std::string& base, const std::string& path);

} // namespace swiv
