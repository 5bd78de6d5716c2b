#include <kiln/placeholder.hpp>
#include <algorithm>

namespace kiln {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static std::string available_vars_hint(const PlaceholderMap& vars) {
    if (vars.empty()) return "no placeholders defined";
    std::vector<std::string> keys;
    keys.reserve(vars.size());
    for (const auto& kv : vars) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());

    std::string hint = "available placeholders: ";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) hint += ", ";
        hint += keys[i];
    }
    return hint;
}

Result<std::string> expand_placeholders(const std::string& tmpl,
                                        const PlaceholderMap& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;

    while (i < tmpl.size()) {
        if (i + 2 < tmpl.size() && tmpl[i] == '\\' && tmpl[i + 1] == '{' && tmpl[i + 2] == '{') {
            out += "{{";
            i += 3;
            continue;
        }

        if (i + 1 < tmpl.size() && tmpl[i] == '{' && tmpl[i + 1] == '{') {
            size_t start = i + 2;
            size_t end = tmpl.find("}}", start);
            if (end == std::string::npos) {
                return KilnError(KilnError::Parse,
                    "unclosed '{{' in '" + tmpl + "' at position " + std::to_string(i));
            }

            std::string varname = trim(tmpl.substr(start, end - start));
            if (varname.empty()) {
                return KilnError(KilnError::Parse,
                    "empty placeholder in '" + tmpl + "' at position " + std::to_string(i));
            }

            auto it = vars.find(varname);
            if (it == vars.end()) {
                return KilnError(KilnError::Config,
                    "undefined placeholder '" + varname + "' in '" + tmpl + "'",
                    available_vars_hint(vars));
            }

            out += it->second;
            i = end + 2;
            continue;
        }

        out.push_back(tmpl[i]);
        i++;
    }

    return Result<std::string>::ok(std::move(out));
}

Result<std::vector<std::string>> expand_command(const std::vector<std::string>& argv,
                                                const PlaceholderMap& vars) {
    std::vector<std::string> out;
    out.reserve(argv.size());
    for (const auto& arg : argv) {
        auto expanded = expand_placeholders(arg, vars);
        if (expanded.is_err()) return std::move(expanded).error();
        out.push_back(std::move(expanded).value());
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

} // namespace kiln
