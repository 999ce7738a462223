#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <sodium.h>

namespace uplink {

class ContentHasher {
public:
    virtual ~ContentHasher() = default;

    // lowercase hex digest of the whole file
    virtual std::string hashFile(const std::filesystem::path &path) = 0;
};

// incremental SHA-256, used for streaming verification
class Sha256Stream {
public:
    Sha256Stream();

    void update(const char *data, std::size_t size);
    std::string hex();

private:
    crypto_hash_sha256_state state;
    bool finished = false;
};

class Sha256Hasher : public ContentHasher {
public:
    explicit Sha256Hasher(std::size_t buffer_size = 1u << 20);

    std::string hashFile(const std::filesystem::path &path) override;

private:
    std::size_t buffer_size;
};

// sodium_init() wrapper, safe to call from every constructor
void ensure_sodium();

std::string random_hex(std::size_t bytes);

} // namespace uplink
