#include "transfer/records.hpp"
#include <nlohmann/json.hpp>
#include <iterator>
#include <stdexcept>

using nlohmann::json;

namespace transfer {

namespace {

json optional_string(const std::optional<std::string>& value) {
    if(value) {
        return *value;
    }
    return nullptr;
}

std::optional<std::string> read_optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if(it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}

const char* to_string(OperationKind op) {
    switch (op) {
        case OperationKind::COPY:
            return "copy";
        case OperationKind::MOVE:
            return "move";
    }
    return "copy";
}

OperationKind operation_from_string(const std::string& name) {
    if(name == "copy") return OperationKind::COPY;
    if(name == "move") return OperationKind::MOVE;
    throw std::invalid_argument("Unknown operation type: " + name);
}

const char* to_string(GroupState state) {
    switch (state) {
        case GroupState::PENDING:
            return "pending";
        case GroupState::IN_PROGRESS:
            return "in_progress";
        case GroupState::COMPLETED:
            return "completed";
        case GroupState::PARTIALLY_FAILED:
            return "partially_failed";
    }
    return "pending";
}

bool FileRecord::operator==(const FileRecord& other) const {
    return filename == other.filename &&
           size_bytes == other.size_bytes &&
           modified_time == other.modified_time &&
           md5 == other.md5 &&
           sha256 == other.sha256;
}

bool FileRecord::operator!=(const FileRecord& other) const {
    return !(*this == other);
}

bool GroupRecord::operator==(const GroupRecord& other) const {
    return name == other.name &&
           category == other.category &&
           is_series == other.is_series &&
           partition == other.partition &&
           files == other.files &&
           created_at == other.created_at &&
           operation == other.operation;
}

bool GroupRecord::operator!=(const GroupRecord& other) const {
    return !(*this == other);
}

bool TransferReport::degraded() const {
    return !failures.empty() || !metadata_failures.empty();
}

void TransferReport::merge(TransferReport other) {
    groups.insert(groups.end(), std::make_move_iterator(other.groups.begin()),
                  std::make_move_iterator(other.groups.end()));
    failures.insert(failures.end(), std::make_move_iterator(other.failures.begin()),
                    std::make_move_iterator(other.failures.end()));
    metadata_failures.insert(metadata_failures.end(), std::make_move_iterator(other.metadata_failures.begin()),
                             std::make_move_iterator(other.metadata_failures.end()));
    summaries.insert(summaries.end(), std::make_move_iterator(other.summaries.begin()),
                     std::make_move_iterator(other.summaries.end()));
}

std::vector<GroupSummary> TransferReport::failed_groups() const {
    std::vector<GroupSummary> failed;
    for(const auto& summary : summaries) {
        if(summary.files_planned > 0 && summary.files_transferred == 0) {
            failed.push_back(summary);
        }
    }
    return failed;
}

std::string group_label(const std::string& name, const std::optional<std::string>& partition) {
    if(partition && !partition->empty()) {
        return name + "/" + *partition;
    }
    return name;
}

void to_json(json& j, const TransferGroup& group) {
    j = {
        {"name", group.name},
        {"category", group.category},
        {"partition", optional_string(group.partition)},
        {"files", group.files}
    };
}

void to_json(json& j, const FileRecord& record) {
    j = {
        {"filename", record.filename},
        {"size_bytes", record.size_bytes},
        {"modified_time", record.modified_time},
        {"md5_checksum", optional_string(record.md5)},
        {"sha256_checksum", optional_string(record.sha256)}
    };
}

void to_json(json& j, const GroupRecord& record) {
    json files = json::object();
    for(const auto& [name, file] : record.files) {
        files[name] = file;
    }
    j = {
        {"name", record.name},
        {"tag", record.category},
        {"is_series", record.is_series},
        {"partition", optional_string(record.partition)},
        {"files", files},
        {"created_at", record.created_at},
        {"operation_type", to_string(record.operation)}
    };
}

void to_json(json& j, const TransferFailure& failure) {
    j = {
        {"filename", failure.filename},
        {"group", failure.group},
        {"kind", to_string(failure.kind)},
        {"error", failure.error}
    };
}

void to_json(json& j, const MetadataFailure& failure) {
    j = {
        {"group", failure.group},
        {"error", failure.error}
    };
}

void to_json(json& j, const GroupSummary& summary) {
    j = {
        {"name", summary.name},
        {"partition", optional_string(summary.partition)},
        {"state", to_string(summary.state)},
        {"files_planned", summary.files_planned},
        {"files_transferred", summary.files_transferred},
        {"bytes_planned", summary.bytes_planned}
    };
}

void to_json(json& j, const TransferReport& report) {
    j = {
        {"groups", report.groups},
        {"failures", report.failures},
        {"metadata_failures", report.metadata_failures},
        {"summaries", report.summaries}
    };
}

void from_json(const json& j, TransferGroup& group) {
    group = {
        j.at("name").get<std::string>(),
        j.at("category").get<std::string>(),
        read_optional_string(j, "partition"),
        j.at("files").get<std::vector<std::string>>()
    };
}

void from_json(const json& j, FileRecord& record) {
    record = {
        j.at("filename").get<std::string>(),
        j.at("size_bytes").get<uint64_t>(),
        j.at("modified_time").get<std::string>(),
        read_optional_string(j, "md5_checksum"),
        read_optional_string(j, "sha256_checksum")
    };
}

void from_json(const json& j, GroupRecord& record) {
    std::map<std::string, FileRecord> files;
    for(const auto& [name, file] : j.at("files").items()) {
        files.emplace(name, file.get<FileRecord>());
    }
    record = {
        j.at("name").get<std::string>(),
        j.at("tag").get<std::string>(),
        j.at("is_series").get<bool>(),
        read_optional_string(j, "partition"),
        std::move(files),
        j.at("created_at").get<std::string>(),
        operation_from_string(j.at("operation_type").get<std::string>())
    };
}

std::vector<TransferGroup> plan_from_json(const json& j) {
    const json& groups = j.is_object() ? j.at("groups") : j;
    if(!groups.is_array()) {
        throw std::invalid_argument("Transfer plan must be an array of groups");
    }
    std::vector<TransferGroup> plan;
    for(const auto& entry : groups) {
        plan.push_back(entry.get<TransferGroup>());
    }
    return plan;
}

}
