#pragma once

#include <ferry/result.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ferry {

// Incremental SHA-256 (FIPS 180-4). Integrity hashes throughout ferry are
// the lowercase hex form of this digest.
class Sha256 {
public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads and returns the digest. The hasher is reset afterwards and may
    // be reused for a new message.
    Digest finish();

    static std::string to_hex(const Digest& digest);

private:
    void compress(const uint8_t* block);
    void reset();

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> block_;
    size_t block_len_ = 0;
    uint64_t length_ = 0;
};

std::string sha256_hex(const std::string& data);

// Streams the file through the hasher
Result<std::string> sha256_file(const std::filesystem::path& path);

} // namespace ferry
