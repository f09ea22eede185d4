#pragma once

#include <filesystem>
#include "transfer/records.hpp"

namespace integrity {

    // Size, mtime and (optionally) digests of the file as it is now. Throws transfer::TransferError.
    transfer::FileRecord describe_file(const std::filesystem::path& path, bool with_checksums);

    // Size must match; each digest is compared only when the expected record carries it.
    bool same_content(const transfer::FileRecord& actual, const transfer::FileRecord& expected);

    // Read-only check of a file against a previously captured record.
    bool verify_file(const std::filesystem::path& path, const transfer::FileRecord& expected);
}
