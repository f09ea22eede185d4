#include "filesystem/utils.hpp"

#include <sodium.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fsutils {

bool exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_directory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_writable_directory(const fs::path& path) {
    return fsutils::is_directory(path) && ::access(path.c_str(), W_OK) == 0;
}

bool mkdir(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if(ec) {
        std::cerr << "Cannot create directory " << path << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

bool remove_file(const fs::path& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if(ec) {
        std::cerr << "Cannot remove " << path << ": " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

bool copy_attributes(const fs::path& src, const fs::path& dest) {
    bool ok = true;
    std::error_code ec;

    auto mtime = fs::last_write_time(src, ec);
    if(!ec) {
        fs::last_write_time(dest, mtime, ec);
    }
    if(ec) {
        std::cerr << "Cannot preserve modification time on " << dest << ": " << ec.message() << std::endl;
        ok = false;
    }

    ec.clear();
    auto perms = fs::status(src, ec).permissions();
    if(!ec) {
        fs::permissions(dest, perms, fs::perm_options::replace, ec);
    }
    if(ec) {
        std::cerr << "Cannot preserve permissions on " << dest << ": " << ec.message() << std::endl;
        ok = false;
    }
    return ok;
}

bool write_atomic(const fs::path& path, const std::string& data) {
    fs::path tmp = path;
    tmp += ".tmp";

    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if(!f) return false;
    f << data;
    f.close();
    if(!f) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if(ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

uint64_t get_file_size(const fs::path& path) {
    return fs::file_size(path);
}

std::time_t get_last_write_time(const fs::path& path) {
    using namespace std::chrono;
    fs::file_time_type ftime = fs::last_write_time(path);
    auto sctp = time_point_cast<system_clock::duration>(ftime - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(sctp);
}

std::string to_iso8601(std::time_t time) {
    std::tm tm_buf;
    localtime_r(&time, &tm_buf);
    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return out.str();
}

std::string now_iso8601() {
    return to_iso8601(std::time(nullptr));
}

std::string hash_to_hex(const std::vector<uint8_t>& hash) {
    std::string hex(hash.size() * 2 + 1, '\0');

    sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
    hex.pop_back();
    return hex;
}

std::vector<fs::path> list_files(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    for(const auto& entry : fs::directory_iterator(dir, fs::directory_options::skip_permission_denied, ec)) {
        if(is_file(entry.path())) {
            files.push_back(entry.path());
        }
    }
    if(ec) {
        std::cerr << "Cannot list " << dir << ": " << ec.message() << std::endl;
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<fs::path> list_directories(const fs::path& dir) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    for(const auto& entry : fs::directory_iterator(dir, fs::directory_options::skip_permission_denied, ec)) {
        if(fsutils::is_directory(entry.path())) {
            dirs.push_back(entry.path());
        }
    }
    if(ec) {
        std::cerr << "Cannot list " << dir << ": " << ec.message() << std::endl;
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

}
