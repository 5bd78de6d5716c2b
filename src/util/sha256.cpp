#include <kiln/sha256.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>

namespace kiln {

namespace {

constexpr std::array<uint32_t, 64> ROUND_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

constexpr std::array<uint32_t, 8> INITIAL_STATE = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

inline uint32_t rotr(uint32_t x, int n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

} // namespace

SHA256::SHA256() : state_(INITIAL_STATE) {}

void SHA256::process_block(const uint8_t* block) {
    // 16-word rolling message schedule: w[t & 15] holds W[t-16] until round t rewrites it
    uint32_t w[16];
    for (int i = 0; i < 16; ++i) w[i] = load_be32(block + 4 * i);

    std::array<uint32_t, 8> v = state_;   // a b c d e f g h
    for (int t = 0; t < 64; ++t) {
        if (t >= 16) {
            uint32_t x = w[(t - 15) & 15];
            uint32_t y = w[(t - 2) & 15];
            uint32_t s0 = rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3);
            uint32_t s1 = rotr(y, 17) ^ rotr(y, 19) ^ (y >> 10);
            w[t & 15] += s0 + w[(t - 7) & 15] + s1;
        }

        uint32_t a = v[0];
        uint32_t e = v[4];
        uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) +
                      ((e & v[5]) ^ (~e & v[6])) + ROUND_K[t] + w[t & 15];
        uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) +
                      ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));

        for (int i = 7; i > 0; --i) v[i] = v[i - 1];
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (int i = 0; i < 8; ++i) state_[i] += v[i];
}

void SHA256::update(const uint8_t* data, size_t len) {
    total_bytes_ += len;
    while (len > 0) {
        if (pending_len_ == 0 && len >= sizeof(pending_)) {
            process_block(data);
            data += sizeof(pending_);
            len -= sizeof(pending_);
            continue;
        }
        size_t take = std::min(len, sizeof(pending_) - pending_len_);
        std::memcpy(pending_ + pending_len_, data, take);
        pending_len_ += take;
        data += take;
        len -= take;
        if (pending_len_ == sizeof(pending_)) {
            process_block(pending_);
            pending_len_ = 0;
        }
    }
}

void SHA256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

void SHA256::update_field(const std::string& s) {
    update(std::to_string(s.size()));
    update(":");
    update(s);
}

std::array<uint8_t, 32> SHA256::finalize() {
    const uint64_t bit_len = total_bytes_ * 8;

    // 0x80, zeros up to 56 mod 64, then the bit length big-endian
    uint8_t tail[72] = {0x80};
    size_t zeros_end = (pending_len_ < 56 ? 56 : 120) - pending_len_;
    for (int i = 0; i < 8; ++i) {
        tail[zeros_end + i] = static_cast<uint8_t>(bit_len >> (56 - 8 * i));
    }
    update(tail, zeros_end + 8);

    std::array<uint8_t, 32> digest;
    for (size_t i = 0; i < digest.size(); ++i) {
        digest[i] = static_cast<uint8_t>(state_[i / 4] >> (24 - 8 * (i % 4)));
    }
    return digest;
}

std::string SHA256::finalize_hex() {
    return bytes_to_hex(finalize());
}

std::string SHA256::bytes_to_hex(const std::array<uint8_t, 32>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string hex(bytes.size() * 2, '0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        hex[2 * i] = digits[bytes[i] >> 4];
        hex[2 * i + 1] = digits[bytes[i] & 0xf];
    }
    return hex;
}

Status SHA256::update_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return KilnError{KilnError::IO, "cannot open " + path.string() + " for hashing"};
    }
    std::vector<char> chunk(64 * 1024);
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (in.gcount() > 0) {
            update(reinterpret_cast<const uint8_t*>(chunk.data()),
                   static_cast<size_t>(in.gcount()));
        }
    }
    if (in.bad()) {
        return KilnError{KilnError::IO, "read error while hashing " + path.string()};
    }
    return ok_status();
}

std::string SHA256::hash_hex(const std::string& input) {
    SHA256 h;
    h.update(input);
    return h.finalize_hex();
}

Result<std::string> SHA256::hash_file(const std::filesystem::path& path) {
    SHA256 h;
    KILN_TRY(h.update_file(path));
    return Result<std::string>::ok(h.finalize_hex());
}

std::string SHA256::hash_fields(const std::vector<std::string>& fields) {
    SHA256 h;
    for (const auto& f : fields) h.update_field(f);
    return h.finalize_hex();
}

} // namespace kiln
