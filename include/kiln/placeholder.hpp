#pragma once

#include <kiln/result.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

using PlaceholderMap = std::unordered_map<std::string, std::string>;

// Substitute {{ var }} placeholders in a string.
// Returns an error on undefined variables or unclosed braces.
// \{{ produces a literal {{.
Result<std::string> expand_placeholders(const std::string& tmpl,
                                        const PlaceholderMap& vars);

// Expand every argument of a command line
Result<std::vector<std::string>> expand_command(const std::vector<std::string>& argv,
                                                const PlaceholderMap& vars);

} // namespace kiln
