#pragma once

#include <kiln/result.hpp>
#include <string>
#include <vector>

namespace kiln {

// A pinned package version: major.minor.micro with an optional
// pre-release label ("rc1", "beta"). Labelled versions sort before the
// release they lead up to.
struct Version {
    int major = 0;
    int minor = 0;
    int micro = 0;
    std::string label;

    // Exactly three numeric components, then optionally "-label"
    static Result<Version> parse(const std::string& s);
    // Lock file spellings: "v1.2", "2", "1.0rc1", "2.0.0.post1"
    static Result<Version> parse_loose(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Version as written in a constraint; unset components are -1
struct PartialVersion {
    int major = 0;
    int minor = -1;
    int micro = -1;

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;
};

enum class ConstraintOp {
    Exact,       // =1.2.3, ==1.2.3, ===1.2.3
    Caret,       // ^1.2.3
    Tilde,       // ~1.2.3
    Compatible,  // ~=1.4 is >=1.4,<2; ~=1.4.2 is >=1.4.2,<1.5
    GreaterEq,
    Greater,
    LessEq,
    Less,
};

struct VersionConstraint {
    ConstraintOp op;
    PartialVersion version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Comma-separated constraints that must all hold: ">=2.28, <3"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    // default_op applies to a bare version: npm reads "1.2.3" as exact
    static Result<VersionReq> parse(const std::string& s,
                                    ConstraintOp default_op = ConstraintOp::Caret);
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace kiln
