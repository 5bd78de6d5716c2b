#include <kiln/dep_manifest.hpp>
#include <kiln/sha256.hpp>
#include <kiln/version.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace kiln {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool is_wildcard(const std::string& r) {
    return r.empty() || r == "*" || r == "x" || r == "X" || r == "latest";
}

// npm git/file/tarball/alias specs and pip direct references
bool names_a_source(const std::string& r) {
    return r.find(':') != std::string::npos || r.find('/') != std::string::npos ||
           r[0] == '@';
}

// "1.2.x" / "==1.2.*" -> "~1.2.0"; "1.x" -> "^1.0.0"
std::string rewrite_wildcard(const std::string& token) {
    size_t digits = token.find_first_of("0123456789");
    if (digits == std::string::npos) return token;
    std::string op = token.substr(0, digits);
    std::string ver = token.substr(digits);
    if (ver.size() < 2) return token;
    std::string tail = ver.substr(ver.size() - 2);
    if (tail != ".x" && tail != ".X" && tail != ".*") return token;
    if (!op.empty() && op != "=" && op != "==") return token;

    std::string core = ver.substr(0, ver.size() - 2);
    size_t dots = static_cast<size_t>(std::count(core.begin(), core.end(), '.'));
    if (dots == 0) return "^" + core + ".0.0";
    return "~" + core + ".0";
}

// One npm/pip comparator set ("a b" and "a, b" both mean AND) in
// VersionReq syntax
std::string to_req_syntax(const std::string& alt) {
    std::vector<std::string> tokens;
    std::string cleaned;
    for (char c : alt) cleaned += (c == ',') ? ' ' : c;
    std::istringstream in(cleaned);
    std::string tok;
    while (in >> tok) tokens.push_back(tok);

    // Hyphen range "1.0.0 - 2.0.0"
    if (tokens.size() == 3 && tokens[1] == "-") {
        return ">=" + tokens[0] + ",<=" + tokens[2];
    }

    std::vector<std::string> merged;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];
        bool bare_op = t.find_first_of("0123456789") == std::string::npos;
        if (bare_op && i + 1 < tokens.size()) {
            merged.push_back(t + tokens[i + 1]);
            ++i;
        } else {
            merged.push_back(t);
        }
    }

    std::string out;
    for (const auto& m : merged) {
        if (!out.empty()) out += ",";
        out += rewrite_wildcard(m);
    }
    return out;
}

struct RequirementLine {
    std::string name;
    std::string spec;
};

// "requests[socks]>=2.0,<3 ; python_version>'3'  # comment"
Result<RequirementLine> parse_requirement_line(const std::string& raw,
                                               const std::string& file, int line_no) {
    std::string line = raw;
    size_t semi = line.find(';');
    if (semi != std::string::npos) line = line.substr(0, semi);
    size_t opt = line.find(" --");
    if (opt != std::string::npos) line = line.substr(0, opt);
    line = trim(line);

    size_t i = 0;
    while (i < line.size() &&
           (std::isalnum(static_cast<unsigned char>(line[i])) ||
            line[i] == '.' || line[i] == '_' || line[i] == '-')) {
        ++i;
    }
    if (i == 0) {
        return KilnError{KilnError::Parse,
            "cannot read requirement '" + trim(raw) + "'",
            "expected name[extras] followed by an optional version range",
            file, line_no};
    }

    RequirementLine req;
    req.name = normalize_python_name(line.substr(0, i));

    std::string rest = trim(line.substr(i));
    if (!rest.empty() && rest[0] == '[') {
        size_t close = rest.find(']');
        if (close == std::string::npos) {
            return KilnError{KilnError::Parse,
                "unclosed extras in requirement '" + trim(raw) + "'", "", file, line_no};
        }
        rest = trim(rest.substr(close + 1));
    }
    if (!rest.empty() && rest.front() == '(' && rest.back() == ')') {
        rest = trim(rest.substr(1, rest.size() - 2));
    }
    req.spec = rest;
    return Result<RequirementLine>::ok(std::move(req));
}

// Calls `on_line` for every non-blank, non-comment line
template<typename F>
Status for_each_requirement_line(const std::string& text, F&& on_line) {
    std::istringstream in(text);
    std::string raw;
    int line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = raw;
        for (size_t p = line.find('#'); p != std::string::npos; p = line.find('#', p + 1)) {
            if (p == 0 || line[p - 1] == ' ' || line[p - 1] == '\t') {
                line = line.substr(0, p);
                break;
            }
        }
        line = trim(line);
        if (line.empty()) continue;
        KILN_TRY(on_line(line, line_no));
    }
    return ok_status();
}

Status parse_requirements(const std::string& text, const std::string& file,
                          DependencyManifest& m) {
    std::map<std::string, std::string> merged;
    auto st = for_each_requirement_line(text, [&](const std::string& line, int line_no) -> Status {
        if (line[0] == '-') {
            m.options.push_back(line);
            return ok_status();
        }
        auto req = parse_requirement_line(line, file, line_no);
        if (req.is_err()) return std::move(req).error();
        std::string& spec = merged[req.value().name];
        if (!req.value().spec.empty()) {
            if (!spec.empty()) spec += ",";
            spec += req.value().spec;
        }
        return ok_status();
    });
    KILN_TRY(st);

    for (const auto& [name, spec] : merged) {
        m.declared_packages.push_back({name, spec});
    }
    return ok_status();
}

Status parse_requirements_lock(const std::string& text, const std::string& file,
                               DependencyManifest& m) {
    std::set<std::string> pins;
    auto st = for_each_requirement_line(text, [&](const std::string& line, int line_no) -> Status {
        if (line[0] == '-') return ok_status();
        auto req = parse_requirement_line(line, file, line_no);
        if (req.is_err()) return std::move(req).error();
        const std::string& spec = req.value().spec;
        std::string version;
        if (spec.rfind("===", 0) == 0) {
            version = trim(spec.substr(3));
        } else if (spec.rfind("==", 0) == 0) {
            version = trim(spec.substr(2));
        } else if (spec.rfind("@", 0) == 0) {
            version = trim(spec.substr(1));
        } else {
            return KilnError{KilnError::Parse,
                "lock entry '" + line + "' is not pinned",
                "lock files list exact versions: name==1.2.3", file, line_no};
        }
        m.locked[req.value().name] = version;
        pins.insert(req.value().name + "==" + version);
        return ok_status();
    });
    KILN_TRY(st);

    for (const auto& p : pins) {
        m.lock_canonical += p;
        m.lock_canonical += '\n';
    }
    return ok_status();
}

Result<json> parse_json(const std::string& text, const std::string& file) {
    try {
        return Result<json>::ok(json::parse(text));
    } catch (const json::exception& e) {
        return KilnError{KilnError::Parse,
            "invalid JSON in " + file + ": " + e.what()};
    }
}

Status parse_package_json(const std::string& text, const std::string& file,
                          DependencyManifest& m) {
    auto doc = parse_json(text, file);
    if (doc.is_err()) return std::move(doc).error();
    const json& j = doc.value();
    if (!j.is_object()) {
        return KilnError{KilnError::Parse, file + " must contain a JSON object"};
    }

    // The build step needs devDependencies as well
    std::map<std::string, std::string> merged;
    for (const char* section : {"dependencies", "devDependencies"}) {
        if (!j.contains(section)) continue;
        const json& deps = j.at(section);
        if (!deps.is_object()) {
            return KilnError{KilnError::Parse,
                std::string(section) + " in " + file + " must be an object"};
        }
        for (const auto& [name, range] : deps.items()) {
            if (!range.is_string()) {
                return KilnError{KilnError::Parse,
                    "version range of '" + name + "' in " + file + " must be a string"};
            }
            merged[name] = range.get<std::string>();
        }
    }
    for (const auto& [name, range] : merged) {
        m.declared_packages.push_back({name, range});
    }
    return ok_status();
}

Status parse_package_lock(const std::string& text, const std::string& file,
                          DependencyManifest& m) {
    auto doc = parse_json(text, file);
    if (doc.is_err()) return std::move(doc).error();
    const json& j = doc.value();
    if (!j.is_object()) {
        return KilnError{KilnError::Parse, file + " must contain a JSON object"};
    }

    const std::string prefix = "node_modules/";
    if (j.contains("packages") && j.at("packages").is_object()) {
        // lockfileVersion 2 and 3
        for (const auto& [key, entry] : j.at("packages").items()) {
            if (key.rfind(prefix, 0) != 0) continue;
            std::string name = key.substr(prefix.size());
            if (name.find("/node_modules/") != std::string::npos) continue;
            if (entry.is_object() && entry.contains("version") && entry.at("version").is_string()) {
                m.locked[name] = entry.at("version").get<std::string>();
            }
        }
    } else if (j.contains("dependencies") && j.at("dependencies").is_object()) {
        // lockfileVersion 1
        for (const auto& [name, entry] : j.at("dependencies").items()) {
            if (entry.is_object() && entry.contains("version") && entry.at("version").is_string()) {
                m.locked[name] = entry.at("version").get<std::string>();
            }
        }
    } else {
        return KilnError{KilnError::Parse,
            file + " has neither 'packages' nor 'dependencies'",
            "regenerate it with npm install"};
    }

    // Sorted keys, no insignificant whitespace
    m.lock_canonical = j.dump();
    return ok_status();
}

Result<std::optional<std::string>> read_optional_file(const fs::path& p) {
    std::error_code ec;
    if (!fs::exists(p, ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    std::ifstream file(p, std::ios::binary);
    if (!file.is_open()) {
        return KilnError{KilnError::IO, "cannot read " + p.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::optional<std::string>>::ok(ss.str());
}

} // namespace

std::string normalize_python_name(const std::string& name) {
    std::string out;
    bool in_sep = false;
    for (char c : name) {
        if (c == '-' || c == '_' || c == '.') {
            if (!in_sep) out += '-';
            in_sep = true;
        } else {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            in_sep = false;
        }
    }
    return out;
}

Result<bool> requirement_satisfied(const std::string& requirement,
                                   const std::string& version) {
    std::string req = trim(requirement);
    if (is_wildcard(req) || names_a_source(req)) {
        return Result<bool>::ok(true);
    }

    // Exact pins compare as strings first so that versions outside the
    // major.minor.micro scheme (2.0.0.post1, 1.0rc1) still match
    // "===" is arbitrary equality: nothing but the exact string matches
    if (req.rfind("===", 0) == 0) {
        return Result<bool>::ok(trim(req.substr(3)) == version);
    }
    std::string pinned = req;
    if (pinned.rfind("==", 0) == 0) pinned = trim(pinned.substr(2));
    else if (pinned.rfind("=", 0) == 0) pinned = trim(pinned.substr(1));
    if (pinned == version) return Result<bool>::ok(true);

    auto v = Version::parse_loose(version);
    if (v.is_err()) return std::move(v).error();

    std::string rest = req;
    while (true) {
        size_t bar = rest.find("||");
        std::string alt = trim(rest.substr(0, bar));
        if (is_wildcard(alt)) return Result<bool>::ok(true);

        // VersionReq has no exclusion operator; check "!=" separately
        std::string ranges;
        bool excluded = false;
        std::istringstream parts(to_req_syntax(alt));
        std::string part;
        while (std::getline(parts, part, ',')) {
            if (part.rfind("!=", 0) == 0) {
                auto ex = Version::parse_loose(part.substr(2));
                if (part.substr(2) == version || (ex.is_ok() && ex.value() == v.value())) {
                    excluded = true;
                }
                continue;
            }
            if (!ranges.empty()) ranges += ",";
            ranges += part;
        }

        if (!excluded) {
            if (ranges.empty()) return Result<bool>::ok(true);
            auto parsed = VersionReq::parse(ranges, ConstraintOp::Exact);
            if (parsed.is_err()) return std::move(parsed).error();
            if (parsed.value().matches(v.value())) return Result<bool>::ok(true);
        }

        if (bar == std::string::npos) break;
        rest = rest.substr(bar + 2);
    }
    return Result<bool>::ok(false);
}

Result<DependencyManifest> DependencyManifest::parse(const Ecosystem& ecosystem,
                                                     const std::string& manifest_text,
                                                     const std::optional<std::string>& lock_text) {
    DependencyManifest m;
    m.ecosystem = ecosystem.name;
    m.format = ecosystem.format;
    m.manifest_file = ecosystem.manifest_file;
    m.lock_file = ecosystem.lock_file;

    switch (ecosystem.format) {
    case ManifestFormat::Requirements:
        KILN_TRY(parse_requirements(manifest_text, m.manifest_file, m));
        if (lock_text) {
            KILN_TRY(parse_requirements_lock(*lock_text, m.lock_file, m));
        }
        break;
    case ManifestFormat::PackageJson:
        KILN_TRY(parse_package_json(manifest_text, m.manifest_file, m));
        if (lock_text) {
            KILN_TRY(parse_package_lock(*lock_text, m.lock_file, m));
        }
        break;
    }
    m.has_lock = lock_text.has_value();

    std::sort(m.declared_packages.begin(), m.declared_packages.end(),
              [](const DeclaredPackage& a, const DeclaredPackage& b) { return a.name < b.name; });

    SHA256 h;
    h.update_field(m.ecosystem);
    h.update_field(to_string(m.format));
    h.update_field("declared");
    for (const auto& p : m.declared_packages) {
        h.update_field(p.name);
        h.update_field(p.requirement);
    }
    h.update_field("options");
    for (const auto& o : m.options) h.update_field(o);
    h.update_field(m.has_lock ? "lock" : "no-lock");
    h.update_field(m.lock_canonical);
    m.lock_fingerprint = h.finalize_hex();

    return Result<DependencyManifest>::ok(std::move(m));
}

Result<DependencyManifest> DependencyManifest::from_source(const Ecosystem& ecosystem,
                                                           const fs::path& dir) {
    fs::path manifest_path = dir / ecosystem.manifest_file;
    auto manifest_text = read_optional_file(manifest_path);
    if (manifest_text.is_err()) return std::move(manifest_text).error();
    if (!manifest_text.value()) {
        return KilnError{KilnError::NotFound,
            "no " + ecosystem.manifest_file + " in " + dir.string(),
            ecosystem.name + " services declare their dependencies in " +
            ecosystem.manifest_file};
    }

    std::optional<std::string> lock_text;
    if (!ecosystem.lock_file.empty()) {
        auto lt = read_optional_file(dir / ecosystem.lock_file);
        if (lt.is_err()) return std::move(lt).error();
        lock_text = std::move(lt).value();
    }

    auto m = DependencyManifest::parse(ecosystem, *manifest_text.value(), lock_text);
    if (m.is_err() && m.error().file.empty()) {
        m.error().file = manifest_path.string();
    }
    return m;
}

Status DependencyManifest::check_lock() const {
    if (!has_lock) {
        return KilnError{KilnError::LockMismatch,
            "lock file " + lock_file + " is missing",
            "a ci-clean install only installs what the lock file pins; "
            "generate " + lock_file + " with a dev build first"};
    }

    std::vector<std::string> problems;
    for (const auto& pkg : declared_packages) {
        auto it = locked.find(pkg.name);
        if (it == locked.end()) {
            problems.push_back("'" + pkg.name + "' is declared in " + manifest_file +
                               " but not locked");
            continue;
        }
        auto ok = requirement_satisfied(pkg.requirement, it->second);
        if (ok.is_err()) {
            problems.push_back("'" + pkg.name + "': cannot compare locked " + it->second +
                               " with " + pkg.requirement + " (" + ok.error().message + ")");
        } else if (!ok.value()) {
            problems.push_back("'" + pkg.name + "' is locked at " + it->second +
                               ", outside the declared range " + pkg.requirement);
        }
    }

    if (problems.empty()) return ok_status();

    KilnError err{KilnError::LockMismatch,
        manifest_file + " and " + lock_file + " disagree: " + problems.front(),
        "update " + lock_file + " so it satisfies " + manifest_file};
    std::string all;
    for (const auto& p : problems) {
        if (!all.empty()) all += "\n";
        all += p;
    }
    err.with_cause(all);
    return err;
}

} // namespace kiln
