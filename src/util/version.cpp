#include <kiln/version.hpp>
#include <algorithm>
#include <cctype>
#include <climits>
#include <sstream>

namespace kiln {

namespace {

KilnError version_error(const std::string& msg, const std::string& hint = "") {
    return KilnError{KilnError::Version, msg, hint};
}

std::string strip(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Non-negative decimal that fits an int, or -1
int to_component(const std::string& s) {
    if (!all_digits(s) || s.size() > 9) return -1;
    return std::stoi(s);
}

std::vector<std::string> split_dots(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream in(s);
    std::string part;
    while (std::getline(in, part, '.')) parts.push_back(part);
    if (!s.empty() && s.back() == '.') parts.push_back("");
    return parts;
}

Version bump(int major, int minor, int micro) {
    Version v;
    v.major = major;
    v.minor = minor;
    v.micro = micro;
    return v;
}

} // namespace

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) return version_error("empty version string");

    size_t dash = s.find('-');
    std::vector<std::string> parts = split_dots(s.substr(0, dash));
    if (parts.size() != 3) {
        return version_error("invalid version '" + s + "'",
                             "expected major.minor.micro[-label]");
    }

    Version v;
    int* fields[] = {&v.major, &v.minor, &v.micro};
    for (size_t i = 0; i < 3; ++i) {
        *fields[i] = to_component(parts[i]);
        if (*fields[i] < 0) {
            return version_error("invalid component '" + parts[i] + "' in version '" + s + "'");
        }
    }
    if (dash != std::string::npos) {
        v.label = s.substr(dash + 1);
        if (v.label.empty()) return version_error("empty label after '-' in '" + s + "'");
    }
    return Result<Version>::ok(std::move(v));
}

Result<Version> Version::parse_loose(const std::string& raw) {
    std::string s = strip(raw);
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) s.erase(0, 1);
    if (s.empty()) return version_error("empty version string");

    std::string label;
    size_t dash = s.find('-');
    if (dash != std::string::npos) {
        label = s.substr(dash + 1);
        s.erase(dash);
    }

    Version v;
    int* fields[] = {&v.major, &v.minor, &v.micro};
    size_t filled = 0;
    for (const auto& part : split_dots(s)) {
        if (part.empty()) return version_error("cannot read version '" + raw + "'");
        // "0rc1" -> 0 and label "rc1"; "post1" -> label
        size_t digits = 0;
        while (digits < part.size() && std::isdigit(static_cast<unsigned char>(part[digits]))) {
            ++digits;
        }
        if (digits == 0 && filled > 0 && label.empty()) {
            label = part;
            continue;
        }
        if (digits == 0 || !label.empty() || filled == 3) {
            return version_error("cannot read version '" + raw + "'");
        }
        *fields[filled] = to_component(part.substr(0, digits));
        if (*fields[filled] < 0) return version_error("cannot read version '" + raw + "'");
        ++filled;
        if (digits < part.size()) label = part.substr(digits);
    }
    v.label = label;
    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) + "." +
                    std::to_string(micro);
    return label.empty() ? s : s + "-" + label;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor && micro == o.micro && label == o.label;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (micro != o.micro) return micro < o.micro;
    if (label.empty() || o.label.empty()) return !label.empty() && o.label.empty();
    return label < o.label;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    std::vector<std::string> parts = split_dots(s);
    if (parts.empty() || parts.size() > 3) {
        return version_error("invalid version '" + s + "' in constraint");
    }
    PartialVersion pv;
    int* fields[] = {&pv.major, &pv.minor, &pv.micro};
    for (size_t i = 0; i < parts.size(); ++i) {
        *fields[i] = to_component(parts[i]);
        if (*fields[i] < 0) return version_error("invalid version '" + s + "' in constraint");
    }
    return Result<PartialVersion>::ok(pv);
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) s += "." + std::to_string(minor);
    if (minor >= 0 && micro >= 0) s += "." + std::to_string(micro);
    return s;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const Version& v) const {
    // Pre-releases only satisfy constraints that name them, which none here do
    if (!v.label.empty()) return false;

    const int minor = std::max(version.minor, 0);
    const int micro = std::max(version.micro, 0);
    const Version floor = bump(version.major, minor, micro);

    switch (op) {
    case ConstraintOp::Exact:     return v == floor;
    case ConstraintOp::GreaterEq: return v >= floor;
    case ConstraintOp::Greater:   return v > floor;
    case ConstraintOp::LessEq:    return v <= floor;
    case ConstraintOp::Less:      return v < floor;
    case ConstraintOp::Tilde: {
        Version ceiling = version.minor < 0 ? bump(version.major + 1, 0, 0)
                                            : bump(version.major, minor + 1, 0);
        return v >= floor && v < ceiling;
    }
    case ConstraintOp::Compatible: {
        // The last written component may grow, the one before it may not
        Version ceiling = version.micro < 0 ? bump(version.major + 1, 0, 0)
                                            : bump(version.major, minor + 1, 0);
        return v >= floor && v < ceiling;
    }
    case ConstraintOp::Caret: {
        // The leftmost non-zero component may not change
        Version ceiling;
        if (version.major > 0 || version.minor < 0) ceiling = bump(version.major + 1, 0, 0);
        else if (minor > 0 || version.micro < 0) ceiling = bump(0, minor + 1, 0);
        else ceiling = bump(0, 0, micro + 1);
        return v >= floor && v < ceiling;
    }
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    const char* prefix = "";
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::Caret:     prefix = "^"; break;
    case ConstraintOp::Tilde:     prefix = "~"; break;
    case ConstraintOp::Compatible: prefix = "~="; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

namespace {

struct OpSpelling {
    const char* text;
    ConstraintOp op;
};

// Longest spellings first so ">=" is not read as ">"
const OpSpelling OP_SPELLINGS[] = {
    {"===", ConstraintOp::Exact},
    {"==", ConstraintOp::Exact},     {"~=", ConstraintOp::Compatible},
    {">=", ConstraintOp::GreaterEq}, {"<=", ConstraintOp::LessEq},
    {"=", ConstraintOp::Exact},      {"^", ConstraintOp::Caret},
    {"~", ConstraintOp::Tilde},      {">", ConstraintOp::Greater},
    {"<", ConstraintOp::Less},
};

Result<VersionConstraint> parse_constraint(const std::string& raw, ConstraintOp default_op) {
    std::string s = strip(raw);
    if (s.rfind("!=", 0) == 0) {
        return version_error("exclusion constraint '" + s + "' is not supported",
                             "pin the version in the lock file instead");
    }

    VersionConstraint c{default_op, {}};
    for (const auto& spelling : OP_SPELLINGS) {
        if (s.rfind(spelling.text, 0) == 0) {
            c.op = spelling.op;
            s = strip(s.substr(std::char_traits<char>::length(spelling.text)));
            break;
        }
    }
    if (s.empty()) return version_error("missing version in constraint '" + strip(raw) + "'");

    auto pv = PartialVersion::parse(s);
    if (pv.is_err()) return std::move(pv).error();
    c.version = pv.value();
    if (c.op == ConstraintOp::Compatible && c.version.minor < 0) {
        return version_error("'~=" + s + "' needs at least two version components",
                             "write ~=" + s + ".0");
    }
    return Result<VersionConstraint>::ok(c);
}

} // namespace

Result<VersionReq> VersionReq::parse(const std::string& s, ConstraintOp default_op) {
    if (strip(s).empty()) return version_error("empty version requirement");

    VersionReq req;
    std::istringstream in(s);
    std::string piece;
    while (std::getline(in, piece, ',')) {
        auto c = parse_constraint(piece, default_op);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(c.value());
    }
    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
                       [&](const VersionConstraint& c) { return c.matches(v); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (const auto& c : constraints) {
        if (!s.empty()) s += ", ";
        s += c.to_string();
    }
    return s;
}

} // namespace kiln
