#include "integrity.hpp"
#include "filesystem/checksum.hpp"
#include "filesystem/utils.hpp"
#include <iostream>

namespace integrity {

    transfer::FileRecord describe_file(const std::filesystem::path& path, bool with_checksums) {
        if(!fsutils::is_file(path)) {
            throw transfer::NotFoundError("File not found: " + path.string());
        }

        transfer::FileRecord record;
        try {
            record.filename = path.filename().string();
            record.size_bytes = fsutils::get_file_size(path);
            record.modified_time = fsutils::to_iso8601(fsutils::get_last_write_time(path));
        } catch (const std::filesystem::filesystem_error& e) {
            throw transfer::IOError("Cannot stat " + path.string() + ": " + e.code().message());
        }

        if(with_checksums) {
            fsutils::Digests digests = fsutils::hash_file(path);
            record.md5 = digests.md5;
            record.sha256 = digests.sha256;
        }
        return record;
    }

    bool same_content(const transfer::FileRecord& actual, const transfer::FileRecord& expected) {
        if(actual.size_bytes != expected.size_bytes) {
            return false;
        }
        if(expected.md5 && actual.md5 != expected.md5) {
            return false;
        }
        if(expected.sha256 && actual.sha256 != expected.sha256) {
            return false;
        }
        return true;
    }

    bool verify_file(const std::filesystem::path& path, const transfer::FileRecord& expected) {
        if(!fsutils::is_file(path)) {
            return false;
        }

        bool with_checksums = expected.md5.has_value() || expected.sha256.has_value();
        try {
            transfer::FileRecord actual = describe_file(path, false);
            if(actual.size_bytes != expected.size_bytes) {
                return false;
            }
            if(with_checksums) {
                actual = describe_file(path, true);
            }
            return same_content(actual, expected);
        } catch (const transfer::TransferError& e) {
            std::cerr << "Verification of " << path << " failed: " << e.what() << std::endl;
            return false;
        }
    }
}
