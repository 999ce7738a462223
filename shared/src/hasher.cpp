#include "uplink/hasher.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

namespace uplink {

void ensure_sodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("sodium_init_failed: libsodium could not be initialized");
    }
}

std::string random_hex(std::size_t bytes) {
    ensure_sodium();
    std::vector<unsigned char> raw(bytes);
    randombytes_buf(raw.data(), raw.size());
    std::vector<char> hex(bytes * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
    return std::string(hex.data());
}

Sha256Stream::Sha256Stream() {
    ensure_sodium();
    crypto_hash_sha256_init(&this->state);
}

void Sha256Stream::update(const char *data, std::size_t size) {
    if (this->finished) {
        throw std::logic_error("hash_finished: Cannot update a finished hash");
    }
    if (data == nullptr || size == 0) {
        return;
    }
    crypto_hash_sha256_update(&this->state, reinterpret_cast<const unsigned char *>(data), size);
}

std::string Sha256Stream::hex() {
    if (this->finished) {
        throw std::logic_error("hash_finished: Hash already finalized");
    }
    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&this->state, digest);
    this->finished = true;
    char out[crypto_hash_sha256_BYTES * 2 + 1];
    sodium_bin2hex(out, sizeof(out), digest, sizeof(digest));
    return std::string(out);
}

Sha256Hasher::Sha256Hasher(std::size_t buffer_size) : buffer_size(buffer_size == 0 ? 4096 : buffer_size) {
    ensure_sodium();
}

std::string Sha256Hasher::hashFile(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("file_open_failed: Failed to open file for hashing (path: " + path.string() + ")");
    }
    Sha256Stream stream;
    std::vector<char> buffer(this->buffer_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize read = file.gcount();
        if (read <= 0) {
            break;
        }
        stream.update(buffer.data(), static_cast<std::size_t>(read));
    }
    if (file.bad()) {
        throw std::runtime_error("file_read_failed: Failed to read file for hashing (path: " + path.string() + ")");
    }
    return stream.hex();
}

} // namespace uplink
