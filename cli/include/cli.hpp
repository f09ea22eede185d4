#pragma once

#include <asio/io_context.hpp>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include "transfer/records.hpp"

enum ExitCode {
    EXIT_OK = 0,
    EXIT_GROUP_FAILED = 1,
    EXIT_USAGE = 2
};

struct CliOptions {
    std::string command;
    std::filesystem::path plan;
    std::filesystem::path source;
    std::filesystem::path destination;
    std::filesystem::path subtitles;
    std::filesystem::path report;
    std::filesystem::path directory;
    std::size_t workers = 4;
    bool verify_integrity = true;
};

class Cli {
public:
    explicit Cli(asio::io_context& io_context);
    int run(const CliOptions& options);
    static void usage(const char* program);

private:
    asio::io_context& io_context_;
    std::unordered_map<std::string, std::function<int(const CliOptions&)>> commands_;

    int cmd_help(const CliOptions& options);
    int cmd_copy(const CliOptions& options);
    int cmd_move(const CliOptions& options);
    int cmd_verify(const CliOptions& options);
    int run_transfer(const CliOptions& options, transfer::OperationKind operation);
    void print_report(const transfer::TransferReport& report) const;
    void write_report(const transfer::TransferReport& report, const std::filesystem::path& path) const;
};
