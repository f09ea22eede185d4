#include <asio/post.hpp>
#include <future>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include "transfer_engine.hpp"
#include "metadata_store.hpp"
#include "filesystem/utils.hpp"
#include "transfer/errors.hpp"

namespace fs = std::filesystem;

namespace {

std::size_t checked_workers(const EngineConfig& config) {
    if(config.workers == 0) {
        throw std::invalid_argument("Worker pool size must be positive");
    }
    return config.workers;
}

}

TransferEngine::TransferEngine(EngineConfig config)
    : config_(config), pool_(checked_workers(config)) {
}

TransferEngine::~TransferEngine() {
    pool_.join();
}

transfer::TransferReport TransferEngine::transfer(const std::vector<transfer::TransferGroup>& plan,
                                                  const fs::path& source_root,
                                                  const fs::path& destination_root,
                                                  transfer::OperationKind operation,
                                                  bool verify_integrity) {
    prepare_destination(destination_root);

    transfer::TransferReport report;
    for(const auto& group : plan) {
        run_group(group, source_root, group_directory(destination_root, group),
                  operation, verify_integrity, true, report);
    }
    return report;
}

transfer::TransferReport TransferEngine::transfer(const std::vector<transfer::TransferGroup>& plan,
                                                  const fs::path& source_root,
                                                  const fs::path& destination_root,
                                                  transfer::OperationKind operation) {
    return transfer(plan, source_root, destination_root, operation, config_.verify_integrity);
}

transfer::TransferReport TransferEngine::transfer_subtitles(const std::vector<transfer::TransferGroup>& plan,
                                                            const fs::path& subtitle_root,
                                                            const fs::path& destination_root,
                                                            transfer::OperationKind operation,
                                                            bool verify_integrity) {
    transfer::TransferReport report;
    if(!fsutils::is_directory(subtitle_root)) {
        std::cerr << "Subtitle source does not exist: " << subtitle_root << std::endl;
        return report;
    }
    prepare_destination(destination_root);

    // A folder belongs to the first group whose name prefixes it, unless a later
    // matching group's partition key also appears in the folder name.
    std::vector<std::vector<fs::path>> assigned(plan.size());
    for(const auto& folder : fsutils::list_directories(subtitle_root)) {
        const std::string folder_name = folder.filename().string();
        std::optional<std::size_t> first;
        std::optional<std::size_t> by_partition;
        for(std::size_t i = 0; i < plan.size(); ++i) {
            if(plan[i].name.empty() || folder_name.rfind(plan[i].name, 0) != 0) {
                continue;
            }
            if(!first) {
                first = i;
            }
            if(!by_partition && plan[i].partition && !plan[i].partition->empty()
               && folder_name.find(*plan[i].partition) != std::string::npos) {
                by_partition = i;
            }
        }
        if(by_partition) {
            assigned[*by_partition].push_back(folder);
        } else if(first) {
            assigned[*first].push_back(folder);
        }
    }

    for(std::size_t i = 0; i < plan.size(); ++i) {
        if(assigned[i].empty()) {
            continue;
        }
        transfer::TransferGroup subtitles{plan[i].name, plan[i].category, plan[i].partition, {}};
        for(const auto& folder : assigned[i]) {
            for(const auto& file : fsutils::list_files(folder)) {
                subtitles.files.push_back((folder.filename() / file.filename()).string());
            }
        }
        run_group(subtitles, subtitle_root, group_directory(destination_root, plan[i]) / "subtitles",
                  operation, verify_integrity, false, report);
    }
    return report;
}

void TransferEngine::cancel() {
    bool expected = false;
    if(cancelled_.compare_exchange_strong(expected, true)) {
        std::cout << "Cancellation requested, finishing files in flight..." << std::endl;
    }
}

bool TransferEngine::cancelled() const {
    return cancelled_.load();
}

void TransferEngine::on_progress(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void TransferEngine::on_state_change(StateCallback callback) {
    state_callback_ = std::move(callback);
}

fs::path TransferEngine::group_directory(const fs::path& destination_root, const transfer::TransferGroup& group) {
    fs::path dir = destination_root / group.category / group.name;
    if(group.partition && !group.partition->empty()) {
        dir /= *group.partition;
    }
    return dir;
}

void TransferEngine::prepare_destination(const fs::path& destination_root) const {
    if(!fsutils::is_directory(destination_root) && !fsutils::mkdir(destination_root)) {
        throw transfer::IOError("Destination root cannot be created: " + destination_root.string());
    }
    if(!fsutils::is_writable_directory(destination_root)) {
        throw transfer::IOError("Destination root is not writable: " + destination_root.string());
    }
}

void TransferEngine::run_group(const transfer::TransferGroup& group,
                               const fs::path& source_root,
                               const fs::path& group_dir,
                               transfer::OperationKind operation,
                               bool verify_integrity,
                               bool persist,
                               transfer::TransferReport& report) {
    const std::string label = transfer::group_label(group.name, group.partition);
    transfer::GroupSummary summary{group.name, group.partition, transfer::GroupState::PENDING, 0, 0, 0};
    transfer::GroupRecord record{group.name, group.category, group.partition.has_value(), group.partition,
                                 {}, "", operation};
    std::size_t failed = 0;

    // Duplicate entries are the same file; distinct files sharing a name would collide at the destination.
    std::vector<std::string> files;
    std::set<std::string> seen_entries;
    std::set<std::string> seen_targets;
    for(const auto& file : group.files) {
        if(!seen_entries.insert(file).second) {
            continue;
        }
        summary.files_planned++;
        if(!seen_targets.insert(fs::path(file).filename().string()).second) {
            report.failures.push_back({file, label, transfer::ErrorKind::IO,
                                       "Another file of the group already targets " + fs::path(file).filename().string()});
            failed++;
            continue;
        }
        files.push_back(file);
    }

    if(cancelled()) {
        for(const auto& file : files) {
            report.failures.push_back({file, label, transfer::ErrorKind::CANCELLED, "Transfer cancelled before start"});
        }
        report.summaries.push_back(summary);
        return;
    }

    std::uint64_t total = 0;
    for(const auto& file : files) {
        std::error_code ec;
        auto size = fs::file_size(source_root / file, ec);
        if(!ec) {
            total += size;
        }
    }
    summary.bytes_planned = total;

    ChunkedTransfer chunked(verify_integrity);
    std::atomic<std::uint64_t> done{0};
    std::vector<std::future<TaskResult>> results;
    results.reserve(files.size());

    if(!files.empty()) {
        set_state(label, summary, transfer::GroupState::IN_PROGRESS);
    }
    for(const auto& file : files) {
        TransferTask task{source_root / file, group_dir / fs::path(file).filename(), operation};
        auto job = std::make_shared<std::packaged_task<TaskResult()>>(
            [this, task, file, &label, &chunked, &done, total]() {
                return run_task(task, file, label, chunked, done, total);
            });
        results.push_back(job->get_future());
        asio::post(pool_, [job]() { (*job)(); });
    }

    for(std::size_t i = 0; i < results.size(); ++i) {
        TaskResult result = results[i].get();
        if(auto* file_record = std::get_if<transfer::FileRecord>(&result)) {
            record.files.emplace(files[i], std::move(*file_record));
        } else {
            report.failures.push_back(std::get<transfer::TransferFailure>(std::move(result)));
            failed++;
        }
    }

    summary.files_transferred = record.files.size();
    set_state(label, summary, failed > 0 ? transfer::GroupState::PARTIALLY_FAILED
                                         : transfer::GroupState::COMPLETED);
    std::cout << "Group " << label << ": " << summary.files_transferred << "/" << summary.files_planned
              << " files " << (operation == transfer::OperationKind::MOVE ? "moved" : "copied") << std::endl;

    if(!record.files.empty()) {
        record.created_at = fsutils::now_iso8601();
        if(persist) {
            try {
                metadata::save(record, group_dir);
            } catch (const transfer::MetadataError& e) {
                std::cerr << "Metadata for " << label << " was not saved: " << e.what() << std::endl;
                report.metadata_failures.push_back({label, e.message()});
            }
        }
        report.groups.push_back(std::move(record));
    }
    report.summaries.push_back(summary);
}

TransferEngine::TaskResult TransferEngine::run_task(const TransferTask& task,
                                                    const std::string& filename,
                                                    const std::string& label,
                                                    const ChunkedTransfer& chunked,
                                                    std::atomic<std::uint64_t>& done,
                                                    std::uint64_t total) const {
    if(cancelled()) {
        return transfer::TransferFailure{filename, label, transfer::ErrorKind::CANCELLED, "Transfer cancelled"};
    }

    try {
        return chunked.run(task, [&](std::uint64_t bytes) {
            std::uint64_t now = done.fetch_add(bytes) + bytes;
            if(progress_callback_) {
                progress_callback_(label, now, total);
            }
        });
    } catch (const transfer::TransferError& e) {
        std::cerr << "Failed to process " << task.source << ": " << e.what() << std::endl;
        return transfer::TransferFailure{filename, label, e.kind(), e.message()};
    } catch (const std::exception& e) {
        std::cerr << "Failed to process " << task.source << ": " << e.what() << std::endl;
        return transfer::TransferFailure{filename, label, transfer::ErrorKind::IO, e.what()};
    }
}

void TransferEngine::set_state(const std::string& label, transfer::GroupSummary& summary, transfer::GroupState state) const {
    summary.state = state;
    if(state_callback_) {
        state_callback_(label, state);
    }
}
