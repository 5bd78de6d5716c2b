#pragma once

#include <kiln/result.hpp>
#include <string>

namespace kiln {

// Service / environment / ecosystem name: [a-zA-Z][a-zA-Z0-9_-]*
// Normalized form: lowercase
struct Ident {
    // `kind` is used in error messages ("service", "environment", ...)
    static Result<Ident> parse(const std::string& raw, const std::string& kind = "name");

    const std::string& raw() const;
    const std::string& normalized() const;

    bool operator==(const Ident& o) const;
    bool operator!=(const Ident& o) const;

private:
    std::string raw_;
    std::string normalized_;
};

} // namespace kiln
