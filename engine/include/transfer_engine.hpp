#pragma once

#include <asio/thread_pool.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>
#include "chunked_transfer.hpp"
#include "transfer/records.hpp"

struct EngineConfig {
    std::size_t workers = 4;
    bool verify_integrity = true;
};

// Called from worker threads after every written block.
using ProgressCallback = std::function<void(const std::string& group, std::uint64_t done, std::uint64_t total)>;
using StateCallback = std::function<void(const std::string& group, transfer::GroupState state)>;

class TransferEngine {
public:
    explicit TransferEngine(EngineConfig config = EngineConfig{});
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    transfer::TransferReport transfer(const std::vector<transfer::TransferGroup>& plan,
                                      const std::filesystem::path& source_root,
                                      const std::filesystem::path& destination_root,
                                      transfer::OperationKind operation,
                                      bool verify_integrity);
    transfer::TransferReport transfer(const std::vector<transfer::TransferGroup>& plan,
                                      const std::filesystem::path& source_root,
                                      const std::filesystem::path& destination_root,
                                      transfer::OperationKind operation);

    // Routes subtitle folders named after each group into "<group dir>/subtitles". No sidecar is written.
    transfer::TransferReport transfer_subtitles(const std::vector<transfer::TransferGroup>& plan,
                                                const std::filesystem::path& subtitle_root,
                                                const std::filesystem::path& destination_root,
                                                transfer::OperationKind operation,
                                                bool verify_integrity);

    // Queued tasks resolve as cancelled, running ones finish their file.
    void cancel();
    bool cancelled() const;

    void on_progress(ProgressCallback callback);
    void on_state_change(StateCallback callback);

    const EngineConfig& config() const { return config_; }

    static std::filesystem::path group_directory(const std::filesystem::path& destination_root,
                                                 const transfer::TransferGroup& group);

private:
    using TaskResult = std::variant<transfer::FileRecord, transfer::TransferFailure>;

    EngineConfig config_;
    asio::thread_pool pool_;
    std::atomic<bool> cancelled_{false};
    ProgressCallback progress_callback_;
    StateCallback state_callback_;

    void prepare_destination(const std::filesystem::path& destination_root) const;
    void run_group(const transfer::TransferGroup& group,
                   const std::filesystem::path& source_root,
                   const std::filesystem::path& group_dir,
                   transfer::OperationKind operation,
                   bool verify_integrity,
                   bool persist,
                   transfer::TransferReport& report);
    TaskResult run_task(const TransferTask& task,
                        const std::string& filename,
                        const std::string& label,
                        const ChunkedTransfer& chunked,
                        std::atomic<std::uint64_t>& done,
                        std::uint64_t total) const;
    void set_state(const std::string& label, transfer::GroupSummary& summary, transfer::GroupState state) const;
};
