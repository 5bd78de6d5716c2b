#pragma once

#include <kiln/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kiln {

// Streaming SHA-256 (FIPS 180-4). Fingerprints, tree checksums and image
// content hashes are all built on it.
class SHA256 {
public:
    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // "<len>:<bytes>", so ("ab","c") and ("a","bc") hash differently
    void update_field(const std::string& s);

    Status update_file(const std::filesystem::path& path);

    // Pads and returns the digest. Call once.
    std::array<uint8_t, 32> finalize();
    std::string finalize_hex();

    static std::string hash_hex(const std::string& input);
    static Result<std::string> hash_file(const std::filesystem::path& path);
    static std::string hash_fields(const std::vector<std::string>& fields);
    static std::string bytes_to_hex(const std::array<uint8_t, 32>& bytes);

private:
    void process_block(const uint8_t* block);

    std::array<uint32_t, 8> state_;
    uint64_t total_bytes_ = 0;
    uint8_t pending_[64];
    size_t pending_len_ = 0;
};

} // namespace kiln
