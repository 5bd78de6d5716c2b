#pragma once

#include <string>
#include <vector>

namespace kiln {

// Shell-style match of a relative path against a pattern, segment by
// segment: * and ? stay within one segment, ** spans any number of
// segments, [a-z] and [!0-9] are character classes.
bool glob_match(const std::string& pattern, const std::string& path);

// "!pattern" re-includes; stores the pattern without '!' in `inner`
bool glob_is_negation(const std::string& pattern, std::string& inner);

// Exclude-list semantics, as in .gitignore: a pattern without a slash
// matches any path component ("__pycache__", "*.pyc"), one with a slash is
// anchored at the tree root. Matching a directory excludes everything in
// it. The last pattern that matches decides.
bool glob_ignored(const std::vector<std::string>& patterns, const std::string& path);

} // namespace kiln
