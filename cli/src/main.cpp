#include <iostream>
#include <stdexcept>
#include <string>
#include <asio/io_context.hpp>
#include <sodium.h>

#include "ordo/version.hpp"
#include "cli.hpp"
#include "filesystem/utils.hpp"

int main(int argc, char* argv[]) {
    // Echo full command line once for diagnostics
    std::cout << "[cmd]";
    for (int i = 0; i < argc; ++i) {
        std::cout << " \"" << argv[i] << '"';
    }
    std::cout << std::endl;

    if (argc < 2) {
        Cli::usage(argv[0]);
        return EXIT_USAGE;
    }

    CliOptions options;
    options.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << flag << " requires a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--plan" || arg == "--source" || arg == "--dest" || arg == "--subtitles"
            || arg == "--report" || arg == "--dir" || arg == "--workers") {
            const char* v = value(arg.c_str());
            if (!v) return EXIT_USAGE;

            if (arg == "--plan") options.plan = v;
            else if (arg == "--source") options.source = v;
            else if (arg == "--dest") options.destination = v;
            else if (arg == "--subtitles") options.subtitles = v;
            else if (arg == "--report") options.report = v;
            else if (arg == "--dir") options.directory = v;
            else {
                try {
                    long workers = std::stol(v);
                    if (workers <= 0) throw std::out_of_range("workers");
                    options.workers = static_cast<std::size_t>(workers);
                } catch (const std::exception&) {
                    std::cerr << "--workers expects a positive integer, got " << v << std::endl;
                    return EXIT_USAGE;
                }
            }
        }
        else if (arg == "--no-verify") {
            options.verify_integrity = false;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            Cli::usage(argv[0]);
            return EXIT_USAGE;
        }
    }

    if (!options.source.empty() && !fsutils::is_directory(options.source)) {
        std::cerr << "Source path does not exist: " << options.source << std::endl;
        return EXIT_USAGE;
    }

    if (sodium_init() < 0) {
        std::cerr << "libsodium failed to initialize\n";
        return EXIT_USAGE;
    }

    std::cout << "ordo (version " << ordo::version() << ")" << std::endl;

    asio::io_context io_context;
    Cli cli(io_context);
    return cli.run(options);
}
