#pragma once

#include <filesystem>
#include <cstddef>
#include <string>

namespace fsutils {

constexpr std::size_t HASH_BLOCK_SIZE = 8 * 1024; // 8 KB read blocks

struct Digests {
    std::string md5;
    std::string sha256;

    bool operator==(const Digests& other) const;
    bool operator!=(const Digests& other) const;
};

// Streams the file once and feeds both hashes. Throws transfer::IOError on open or read failure.
Digests hash_file(const std::filesystem::path& path);

}
