#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "transfer/errors.hpp"

namespace transfer {

using json = nlohmann::json;

enum class OperationKind {
    COPY,
    MOVE
};

enum class GroupState {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    PARTIALLY_FAILED
};

const char* to_string(OperationKind op);
OperationKind operation_from_string(const std::string& name);
const char* to_string(GroupState state);

struct TransferGroup {
    std::string name;
    std::string category;
    std::optional<std::string> partition;
    std::vector<std::string> files;
};

struct FileRecord {
    std::string filename;
    uint64_t size_bytes = 0;
    std::string modified_time;
    std::optional<std::string> md5;
    std::optional<std::string> sha256;

    bool operator==(const FileRecord& other) const;
    bool operator!=(const FileRecord& other) const;
};

struct GroupRecord {
    std::string name;
    std::string category;
    bool is_series = false;
    std::optional<std::string> partition;
    std::map<std::string, FileRecord> files;
    std::string created_at;
    OperationKind operation = OperationKind::COPY;

    bool operator==(const GroupRecord& other) const;
    bool operator!=(const GroupRecord& other) const;
};

struct TransferFailure {
    std::string filename;
    std::string group;
    ErrorKind kind = ErrorKind::IO;
    std::string error;
};

struct MetadataFailure {
    std::string group;
    std::string error;
};

struct GroupSummary {
    std::string name;
    std::optional<std::string> partition;
    GroupState state = GroupState::PENDING;
    std::size_t files_planned = 0;
    std::size_t files_transferred = 0;
    uint64_t bytes_planned = 0;
};

struct TransferReport {
    std::vector<GroupRecord> groups;
    std::vector<TransferFailure> failures;
    std::vector<MetadataFailure> metadata_failures;
    std::vector<GroupSummary> summaries;

    bool degraded() const;
    // Appends every list of other, keeping this report's order first.
    void merge(TransferReport other);
    // Groups that had files planned and none of them transferred.
    std::vector<GroupSummary> failed_groups() const;
};

// "name" or "name/partition", used for progress lines and failure entries.
std::string group_label(const std::string& name, const std::optional<std::string>& partition);

void to_json(json& j, const TransferGroup& group);
void to_json(json& j, const FileRecord& record);
void to_json(json& j, const GroupRecord& record);
void to_json(json& j, const TransferFailure& failure);
void to_json(json& j, const MetadataFailure& failure);
void to_json(json& j, const GroupSummary& summary);
void to_json(json& j, const TransferReport& report);
void from_json(const json& j, TransferGroup& group);
void from_json(const json& j, FileRecord& record);
void from_json(const json& j, GroupRecord& record);

// Accepts either a bare array of groups or an object with a "groups" array.
std::vector<TransferGroup> plan_from_json(const json& j);
}
