#include "metadata_store.hpp"
#include "filesystem/utils.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace fs = std::filesystem;

namespace metadata {

    fs::path sidecar_path(const fs::path& directory) {
        return directory / SIDECAR_NAME;
    }

    void save(const transfer::GroupRecord& record, const fs::path& directory) {
        if(!fsutils::is_directory(directory) && !fsutils::mkdir(directory)) {
            throw transfer::MetadataError("Cannot create metadata directory " + directory.string());
        }

        // Filenames are raw bytes; dump() rejects anything that is not UTF-8.
        std::string contents;
        try {
            json j = record;
            contents = j.dump(2);
        } catch (const json::exception& e) {
            throw transfer::MetadataError("Cannot serialize metadata for " + record.name + ": " + e.what());
        }

        if(!fsutils::write_atomic(sidecar_path(directory), contents)) {
            throw transfer::MetadataError("Failed to write metadata file " + sidecar_path(directory).string());
        }
    }

    std::optional<transfer::GroupRecord> load(const fs::path& directory) {
        fs::path path = sidecar_path(directory);
        if(!fsutils::is_file(path)) return std::nullopt;

        std::ifstream f(path);
        if(!f) {
            std::cerr << "Cannot open metadata file " << path << std::endl;
            return std::nullopt;
        }

        try {
            json j;
            f >> j;
            return j.get<transfer::GroupRecord>();
        } catch (const json::exception& e) {
            std::cerr << "Ignoring malformed metadata file " << path << ": " << e.what() << std::endl;
        } catch (const std::invalid_argument& e) {
            std::cerr << "Ignoring malformed metadata file " << path << ": " << e.what() << std::endl;
        }
        return std::nullopt;
    }
}
