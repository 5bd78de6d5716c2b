#include <kiln/glob.hpp>

namespace kiln {

namespace {

constexpr size_t NONE = static_cast<size_t>(-1);

std::vector<std::string> split_path(const std::string& p) {
    std::vector<std::string> segments;
    std::string cur;
    for (char c : p) {
        if (c == '/' || c == '\\') {
            if (!cur.empty()) segments.push_back(std::move(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) segments.push_back(std::move(cur));
    return segments;
}

// Matches one pattern token at pat[pos] ('?', a [class] or a literal)
// against c and moves pos past the token
bool token_matches(const std::string& pat, size_t& pos, char c) {
    if (pat[pos] == '?') {
        ++pos;
        return true;
    }
    if (pat[pos] == '[') {
        size_t close = pat.find(']', pos + 2);
        if (close != std::string::npos) {
            size_t i = pos + 1;
            bool negate = pat[i] == '!';
            if (negate) ++i;
            bool hit = false;
            for (; i < close; ++i) {
                if (i + 2 < close && pat[i + 1] == '-') {
                    hit = hit || (c >= pat[i] && c <= pat[i + 2]);
                    i += 2;
                } else {
                    hit = hit || c == pat[i];
                }
            }
            pos = close + 1;
            return hit != negate;
        }
        // Unclosed '[' is a literal
    }
    return pat[pos++] == c;
}

// Classic wildcard walk: on a mismatch, retry from the last '*' with one
// more character swallowed
bool segment_matches(const std::string& pat, const std::string& s) {
    size_t p = 0;
    size_t i = 0;
    size_t star_p = NONE;
    size_t star_i = 0;
    while (i < s.size()) {
        if (p < pat.size() && pat[p] == '*') {
            star_p = ++p;
            star_i = i;
            continue;
        }
        size_t next = p;
        if (p < pat.size() && token_matches(pat, next, s[i])) {
            p = next;
            ++i;
            continue;
        }
        if (star_p == NONE) return false;
        p = star_p;
        i = ++star_i;
    }
    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

// Same walk one level up, with "**" as the wildcard over whole segments
bool segments_match(const std::vector<std::string>& pat,
                    const std::vector<std::string>& path,
                    size_t path_len) {
    size_t p = 0;
    size_t i = 0;
    size_t star_p = NONE;
    size_t star_i = 0;
    while (i < path_len) {
        if (p < pat.size() && pat[p] == "**") {
            star_p = ++p;
            star_i = i;
            continue;
        }
        if (p < pat.size() && segment_matches(pat[p], path[i])) {
            ++p;
            ++i;
            continue;
        }
        if (star_p == NONE) return false;
        p = star_p;
        i = ++star_i;
    }
    while (p < pat.size() && pat[p] == "**") ++p;
    return p == pat.size();
}

bool excludes(const std::string& pattern, const std::vector<std::string>& path) {
    std::string trimmed = pattern;
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
    std::vector<std::string> pat = split_path(trimmed);
    if (pat.empty()) return false;

    if (trimmed.find('/') == std::string::npos) {
        for (const auto& component : path) {
            if (segment_matches(pat[0], component)) return true;
        }
        return false;
    }
    for (size_t len = 1; len <= path.size(); ++len) {
        if (segments_match(pat, path, len)) return true;
    }
    return false;
}

} // namespace

bool glob_match(const std::string& pattern, const std::string& path) {
    std::vector<std::string> segments = split_path(path);
    return segments_match(split_path(pattern), segments, segments.size());
}

bool glob_is_negation(const std::string& pattern, std::string& inner) {
    if (pattern.empty() || pattern[0] != '!') return false;
    inner = pattern.substr(1);
    return true;
}

bool glob_ignored(const std::vector<std::string>& patterns, const std::string& path) {
    std::vector<std::string> segments = split_path(path);
    bool ignored = false;
    for (const auto& pattern : patterns) {
        std::string inner;
        if (glob_is_negation(pattern, inner)) {
            if (ignored && excludes(inner, segments)) ignored = false;
        } else if (!ignored && excludes(pattern, segments)) {
            ignored = true;
        }
    }
    return ignored;
}

} // namespace kiln
