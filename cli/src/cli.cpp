#include <asio/signal_set.hpp>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>
#include <nlohmann/json.hpp>
#include "cli.hpp"
#include "progress_printer.hpp"
#include "transfer_engine.hpp"
#include "integrity.hpp"
#include "metadata_store.hpp"
#include "transfer/commands.hpp"
#include "transfer/errors.hpp"
#include "filesystem/utils.hpp"

using nlohmann::json;

namespace fs = std::filesystem;

Cli::Cli(asio::io_context& io_context)
    : io_context_(io_context),
      commands_{
          {transfer::commands::COPY,   [this](const auto& opts){ return cmd_copy(opts); }},
          {transfer::commands::MOVE,   [this](const auto& opts){ return cmd_move(opts); }},
          {transfer::commands::VERIFY, [this](const auto& opts){ return cmd_verify(opts); }},
          {transfer::commands::HELP,   [this](const auto& opts){ return cmd_help(opts); }},
      } {
}

void Cli::usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " copy|move --plan <plan.json> --source <dir> --dest <dir>\n"
              << "        [--subtitles <dir>] [--workers <n>] [--no-verify] [--report <file>]\n"
              << "  " << program << " verify --dir <group dir>\n";
}

int Cli::run(const CliOptions& options) {
    auto it = commands_.find(options.command);
    if(it == commands_.end()) {
        std::cerr << "Unknown command \"" << options.command << "\"." << std::endl;
        return EXIT_USAGE;
    }
    return it->second(options);
}

int Cli::cmd_help(const CliOptions&) {
    for (const auto& [key, value] : commands_) {
        std::cout << key << std::endl;
    }
    return EXIT_OK;
}

int Cli::cmd_copy(const CliOptions& options) {
    return run_transfer(options, transfer::OperationKind::COPY);
}

int Cli::cmd_move(const CliOptions& options) {
    return run_transfer(options, transfer::OperationKind::MOVE);
}

int Cli::cmd_verify(const CliOptions& options) {
    if(options.directory.empty()) {
        std::cerr << "verify requires --dir" << std::endl;
        return EXIT_USAGE;
    }

    auto record = metadata::load(options.directory);
    if(!record) {
        std::cerr << "No readable metadata in " << options.directory << std::endl;
        return EXIT_GROUP_FAILED;
    }

    std::cout << "Group " << transfer::group_label(record->name, record->partition) << " (" << record->category
              << ", " << transfer::to_string(record->operation) << " at " << record->created_at << ")" << std::endl;

    std::size_t bad = 0;
    for(const auto& [name, file] : record->files) {
        bool ok = integrity::verify_file(options.directory / file.filename, file);
        std::cout << (ok ? "  OK      " : "  FAILED  ") << name << std::endl;
        if(!ok) bad++;
    }
    std::cout << record->files.size() - bad << "/" << record->files.size() << " files intact" << std::endl;
    return bad == 0 ? EXIT_OK : EXIT_GROUP_FAILED;
}

int Cli::run_transfer(const CliOptions& options, transfer::OperationKind operation) {
    if(options.plan.empty() || options.source.empty() || options.destination.empty()) {
        std::cerr << options.command << " requires --plan, --source and --dest" << std::endl;
        return EXIT_USAGE;
    }

    std::vector<transfer::TransferGroup> plan;
    try {
        std::ifstream f(options.plan);
        if(!f) {
            std::cerr << "Cannot open plan file " << options.plan << std::endl;
            return EXIT_USAGE;
        }
        json j;
        f >> j;
        plan = transfer::plan_from_json(j);
    } catch (const json::exception& e) {
        std::cerr << "Invalid plan file " << options.plan << ": " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid plan file " << options.plan << ": " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    EngineConfig config{options.workers, options.verify_integrity};
    TransferEngine engine(config);
    ProgressPrinter printer;
    engine.on_progress([&printer](const std::string& group, std::uint64_t done, std::uint64_t total) {
        printer.update(group, done, total);
    });
    engine.on_state_change([&printer](const std::string& group, transfer::GroupState state) {
        printer.state_changed(group, state);
    });

    // handle SIGINT
    asio::signal_set signals(io_context_, SIGINT, SIGTERM);
    signals.async_wait([&engine](const std::error_code& ec, int) {
        if(!ec) {
            std::cout << std::endl << "Interrupt received" << std::endl;
            engine.cancel();
        }
    });
    std::thread signal_thread([this](){
        io_context_.run();
    });

    std::cout << (operation == transfer::OperationKind::MOVE ? "Moving " : "Copying ") << plan.size()
              << " groups with " << config.workers << " workers, integrity checking "
              << (config.verify_integrity ? "on" : "off") << std::endl;

    int code = EXIT_OK;
    try {
        transfer::TransferReport report = engine.transfer(plan, options.source, options.destination, operation);
        if(!options.subtitles.empty()) {
            report.merge(engine.transfer_subtitles(
                plan, options.subtitles, options.destination, operation, config.verify_integrity));
        }

        print_report(report);
        if(!options.report.empty()) {
            write_report(report, options.report);
        }
        if(!report.failed_groups().empty()) {
            code = EXIT_GROUP_FAILED;
        }
    } catch (const std::exception& e) {
        std::cerr << "Transfer aborted: " << e.what() << std::endl;
        code = EXIT_USAGE;
    }

    std::error_code ignored;
    signals.cancel(ignored);
    io_context_.stop();
    signal_thread.join();
    return code;
}

void Cli::write_report(const transfer::TransferReport& report, const fs::path& path) const {
    std::string contents;
    try {
        json j = report;
        contents = j.dump(2);
    } catch (const json::exception& e) {
        std::cerr << "Report could not be serialized: " << e.what() << std::endl;
        return;
    }
    if(!fsutils::write_atomic(path, contents)) {
        std::cerr << "Failed to write report to " << path << std::endl;
    }
}

void Cli::print_report(const transfer::TransferReport& report) const {
    std::size_t transferred = 0;
    for(const auto& group : report.groups) {
        transferred += group.files.size();
    }
    std::cout << "Transferred " << transferred << " files in " << report.summaries.size() << " groups" << std::endl;

    for(const auto& summary : report.summaries) {
        std::cout << "  " << transfer::group_label(summary.name, summary.partition) << ": "
                  << transfer::to_string(summary.state) << " (" << summary.files_transferred << "/"
                  << summary.files_planned << ")" << std::endl;
    }

    if(!report.failures.empty()) {
        std::cout << report.failures.size() << " failed files:" << std::endl;
        for(const auto& failure : report.failures) {
            std::cout << "  [" << failure.group << "] " << failure.filename << " - "
                      << transfer::to_string(failure.kind) << ": " << failure.error << std::endl;
        }
    }
    for(const auto& failure : report.metadata_failures) {
        std::cout << "  metadata for " << failure.group << " not saved: " << failure.error << std::endl;
    }
}
