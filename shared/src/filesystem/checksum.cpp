#include "filesystem/checksum.hpp"
#include "filesystem/utils.hpp"
#include "transfer/errors.hpp"

#include <openssl/evp.h>
#include <sodium.h>
#include <fstream>
#include <memory>
#include <vector>

namespace fsutils {

namespace {

// libsodium has no MD5, so that digest goes through OpenSSL EVP.
class Md5Context {
public:
    Md5Context() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if(!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialize MD5 context");
        }
    }

    void update(const uint8_t* data, std::size_t size) {
        if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw std::runtime_error("MD5 update failed");
        }
    }

    std::vector<uint8_t> final() {
        std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
        unsigned int len = 0;
        if(EVP_DigestFinal_ex(ctx_.get(), hash.data(), &len) != 1) {
            throw std::runtime_error("MD5 finalization failed");
        }
        hash.resize(len);
        return hash;
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

}

bool Digests::operator==(const Digests& other) const {
    return md5 == other.md5 && sha256 == other.sha256;
}

bool Digests::operator!=(const Digests& other) const {
    return !(*this == other);
}

Digests hash_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw transfer::IOError("Failed to open file for hashing: " + path.string());
    }

    std::vector<uint8_t> buffer(HASH_BLOCK_SIZE);
    Md5Context md5;
    crypto_hash_sha256_state sha256;
    crypto_hash_sha256_init(&sha256);

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0) {
            md5.update(buffer.data(), static_cast<std::size_t>(bytes_read));
            crypto_hash_sha256_update(&sha256, buffer.data(), static_cast<unsigned long long>(bytes_read));
        }
    }
    if (file.bad()) {
        throw transfer::IOError("Read failed while hashing: " + path.string());
    }

    std::vector<uint8_t> sha_hash(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&sha256, sha_hash.data());

    return Digests{hash_to_hex(md5.final()), hash_to_hex(sha_hash)};
}

}
