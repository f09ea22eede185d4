#pragma once

#include <filesystem>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace fsutils {
    namespace fs = std::filesystem;

    bool exists(const fs::path& path);
    bool is_file(const fs::path& path);
    bool is_directory(const fs::path& path);
    bool is_writable_directory(const fs::path& path);

    bool mkdir(const fs::path& path);
    bool remove_file(const fs::path& path);

    // Copies modification time and permission bits. Returns false if either could not be applied.
    bool copy_attributes(const fs::path& src, const fs::path& dest);

    // Writes through "<path>.tmp" and renames over the target.
    bool write_atomic(const fs::path& path, const std::string& data);

    uint64_t get_file_size(const fs::path& path);
    std::time_t get_last_write_time(const fs::path& path);

    std::string to_iso8601(std::time_t time);
    std::string now_iso8601();

    std::string hash_to_hex(const std::vector<uint8_t>& hash);

    // Regular files directly inside dir, sorted by name.
    std::vector<fs::path> list_files(const fs::path& dir);
    std::vector<fs::path> list_directories(const fs::path& dir);
}
