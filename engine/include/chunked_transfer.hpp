#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include "transfer/records.hpp"

struct TransferConfig {
    std::size_t CHUNK_SIZE = 1024 * 1024; // 1 MB
};

struct TransferTask {
    std::filesystem::path source;
    std::filesystem::path destination;
    transfer::OperationKind operation;
};

// Receives the byte count of every block once it has been written and flushed.
using ProgressSink = std::function<void(std::uint64_t)>;

class ChunkedTransfer {
public:
    explicit ChunkedTransfer(bool verify_integrity, TransferConfig config = TransferConfig{});

    // Copies or moves one file and describes the destination. Throws transfer::TransferError.
    transfer::FileRecord run(const TransferTask& task, const ProgressSink& progress) const;

private:
    bool verify_integrity_;
    TransferConfig config_;

    void copy_chunks(const TransferTask& task, const ProgressSink& progress) const;
    void finish_move(const TransferTask& task, const transfer::FileRecord& written) const;
};
