#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace kiln {

// Random (version 4) identifier. Runs and scratch directories are named
// after one so that concurrent builds never collide on disk.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid v4();

    // Canonical 8-4-4-4-12 form
    std::string to_string() const;
    // Leading 12 hex digits
    std::string short_id() const;

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return !(*this == other); }
};

} // namespace kiln
