#include <kiln/uuid.hpp>
#include <random>

namespace kiln {

namespace {

std::mt19937_64& thread_generator() {
    // One engine per thread, each seeded from the OS entropy source
    thread_local std::mt19937_64 gen = [] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }();
    return gen;
}

void append_hex(std::string& out, uint8_t byte) {
    static const char digits[] = "0123456789abcdef";
    out.push_back(digits[byte >> 4]);
    out.push_back(digits[byte & 0x0F]);
}

} // namespace

Uuid Uuid::v4() {
    auto& gen = thread_generator();
    Uuid u;
    for (size_t i = 0; i < u.bytes.size(); i += 8) {
        uint64_t word = gen();
        for (size_t j = 0; j < 8; ++j) {
            u.bytes[i + j] = static_cast<uint8_t>(word >> (8 * j));
        }
    }
    u.bytes[6] = static_cast<uint8_t>((u.bytes[6] & 0x0F) | 0x40);
    u.bytes[8] = static_cast<uint8_t>((u.bytes[8] & 0x3F) | 0x80);
    return u;
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        append_hex(out, bytes[i]);
    }
    return out;
}

std::string Uuid::short_id() const {
    std::string out;
    out.reserve(12);
    for (size_t i = 0; i < 6; ++i) append_hex(out, bytes[i]);
    return out;
}

} // namespace kiln
