#pragma once

#include <filesystem>
#include <optional>
#include "transfer/records.hpp"

namespace metadata {

    inline constexpr const char* SIDECAR_NAME = ".ordo_metadata.json";

    std::filesystem::path sidecar_path(const std::filesystem::path& directory);

    // Overwrites any existing sidecar. Throws transfer::MetadataError.
    void save(const transfer::GroupRecord& record, const std::filesystem::path& directory);

    // Absent when there is no sidecar or it cannot be parsed.
    std::optional<transfer::GroupRecord> load(const std::filesystem::path& directory);
}
