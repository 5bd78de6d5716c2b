#include <kiln/ident.hpp>
#include <algorithm>
#include <cctype>

namespace kiln {

Result<Ident> Ident::parse(const std::string& raw, const std::string& kind) {
    if (raw.empty()) {
        return KilnError{KilnError::InvalidArg, "empty " + kind + " name"};
    }

    if (!std::isalpha(static_cast<unsigned char>(raw[0]))) {
        return KilnError{KilnError::InvalidArg,
            "invalid " + kind + " name '" + raw + "'",
            kind + " names must start with a letter"};
    }

    for (size_t i = 1; i < raw.size(); ++i) {
        char c = raw[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-') {
            return KilnError{KilnError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in " + kind + " name '" + raw + "'",
                "allowed: [a-zA-Z0-9_-]"};
        }
    }

    Ident id;
    id.raw_ = raw;
    id.normalized_ = raw;
    std::transform(id.normalized_.begin(), id.normalized_.end(),
                   id.normalized_.begin(),
                   [](char c) -> char {
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });

    return Result<Ident>::ok(std::move(id));
}

const std::string& Ident::raw() const { return raw_; }
const std::string& Ident::normalized() const { return normalized_; }

bool Ident::operator==(const Ident& o) const {
    return normalized_ == o.normalized_;
}

bool Ident::operator!=(const Ident& o) const {
    return !(*this == o);
}

} // namespace kiln
