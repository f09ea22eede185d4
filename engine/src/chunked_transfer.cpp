#include "chunked_transfer.hpp"
#include "integrity.hpp"
#include "filesystem/utils.hpp"
#include "transfer/errors.hpp"
#include <fstream>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

ChunkedTransfer::ChunkedTransfer(bool verify_integrity, TransferConfig config)
    : verify_integrity_(verify_integrity), config_(config) {
}

transfer::FileRecord ChunkedTransfer::run(const TransferTask& task, const ProgressSink& progress) const {
    if(!fsutils::is_file(task.source)) {
        throw transfer::NotFoundError("Source file not found: " + task.source.string());
    }
    std::error_code ec;
    if(fsutils::exists(task.destination) && fs::equivalent(task.source, task.destination, ec)) {
        throw transfer::IOError("Source and destination are the same file: " + task.source.string());
    }

    copy_chunks(task, progress);

    if(!fsutils::copy_attributes(task.source, task.destination)) {
        std::cerr << "Attributes of " << task.source << " were not fully preserved" << std::endl;
    }

    transfer::FileRecord written = integrity::describe_file(task.destination, verify_integrity_);
    if(task.operation == transfer::OperationKind::MOVE) {
        finish_move(task, written);
    }
    return written;
}

void ChunkedTransfer::copy_chunks(const TransferTask& task, const ProgressSink& progress) const {
    fs::path parent_dir = task.destination.parent_path();
    if(!parent_dir.empty() && !fsutils::is_directory(parent_dir)) {
        if(!fsutils::mkdir(parent_dir)) {
            throw transfer::IOError("Failed to create destination directory: " + parent_dir.string());
        }
    }

    std::ifstream infile(task.source, std::ios::binary);
    if(!infile) {
        throw transfer::IOError("Failed to open file for reading: " + task.source.string());
    }
    std::ofstream outfile(task.destination, std::ios::binary | std::ios::trunc);
    if(!outfile) {
        throw transfer::IOError("Failed to open file for writing: " + task.destination.string());
    }

    std::vector<char> buffer(config_.CHUNK_SIZE);
    while(true) {
        infile.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize read_bytes = infile.gcount();
        if(read_bytes <= 0) {
            break; // EOF
        }

        outfile.write(buffer.data(), read_bytes);
        outfile.flush();
        if(!outfile) {
            throw transfer::IOError("Failed to write to file: " + task.destination.string());
        }
        if(progress) {
            progress(static_cast<std::uint64_t>(read_bytes));
        }
    }
    if(infile.bad()) {
        throw transfer::IOError("Failed to read from file: " + task.source.string());
    }

    outfile.close();
    if(!outfile) {
        throw transfer::IOError("Failed to close file: " + task.destination.string());
    }
}

void ChunkedTransfer::finish_move(const TransferTask& task, const transfer::FileRecord& written) const {
    if(verify_integrity_) {
        transfer::FileRecord original = integrity::describe_file(task.source, true);
        if(!integrity::same_content(written, original)) {
            throw transfer::IntegrityError("File verification failed after copy: " + task.source.string());
        }
    }

    if(!fsutils::remove_file(task.source)) {
        throw transfer::IOError("Destination written but source could not be removed: " + task.source.string());
    }
}
