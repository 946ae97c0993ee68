#include "linkfetch/config.hpp"
#include "linkfetch/errors.hpp"
#include "linkfetch/job_engine.hpp"
#include "linkfetch/logging.hpp"
#include "linkfetch/progress_panel.hpp"
#include "linkfetch/detail/curl_utils.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-c <config.json>] [-d <directory>] [-j <jobs>] [-v] <url> [<url> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -c <config.json> Load settings from a JSON file\n"
              << "  -d <directory>   Save downloads here (default: configured destination,\n"
              << "                   or the current directory without a config file)\n"
              << "  -j <jobs>        Number of downloads running at once (default: 2)\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parseJobCount(const std::string& text) {
    int jobs = 0;
    try {
        jobs = std::stoi(text);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid job count: " + text);
    }
    if (jobs <= 0 || jobs > 64) {
        throw std::runtime_error("Job count must be within 1..64.");
    }
    return jobs;
}
} // namespace

int main(int argc, char** argv) {
    try {
        linkfetch::detail::ensureCurlInitialized();

        std::optional<std::filesystem::path> config_path;
        std::optional<std::filesystem::path> download_dir;
        std::optional<int> jobs;
        bool verbose = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-c" || option == "-d" || option == "-j") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                const std::string value = argv[arg_index + 1];
                if (option == "-c") {
                    config_path = value;
                } else if (option == "-d") {
                    download_dir = value;
                } else {
                    jobs = parseJobCount(value);
                }
                arg_index += 2;
            } else if (option == "-v") {
                verbose = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (arg_index >= argc) {
            printUsage(argv[0]);
            return 1;
        }

        linkfetch::EngineConfig config;
        if (config_path) {
            config = linkfetch::loadConfig(*config_path);
        } else {
            // Without a config file the chosen folder is the only allowed root.
            linkfetch::applyEnvironment(config);
            const auto root = download_dir.value_or(std::filesystem::current_path());
            config.allowed_roots = {root};
            config.default_destination = root;
        }

        if (download_dir) {
            std::error_code ec;
            std::filesystem::create_directories(*download_dir, ec);
            if (ec) {
                throw std::runtime_error("Failed to create download directory: "
                                         + download_dir->string() + " - " + ec.message());
            }
            config.default_destination = *download_dir;
        }
        if (jobs) {
            config.max_concurrent_jobs = *jobs;
        }
        if (verbose) {
            config.log.level = "debug";
        }

        linkfetch::initLogging(config.log);
        config.validate();

        auto engine = linkfetch::JobEngine::makeDefault(config);
        engine->start();

        int rejected = 0;
        std::vector<std::string> submitted;
        for (int i = arg_index; i < argc; ++i) {
            try {
                submitted.push_back(engine->submit(argv[i]).id);
            } catch (const linkfetch::ValidationError& ex) {
                std::cerr << "Rejected " << argv[i] << ": " << ex.what() << std::endl;
                ++rejected;
            }
        }

        linkfetch::ProgressPanel panel(*engine);
        panel.run();
        engine->shutdown();

        int failed = rejected;
        for (const auto& id : submitted) {
            const auto job = engine->get(id);
            if (job.status == linkfetch::JobStatus::Failed) {
                std::cerr << "Failed: " << job.source_url << " - "
                          << job.error_message.value_or("unknown error") << std::endl;
                ++failed;
            } else if (job.status == linkfetch::JobStatus::Success && job.saved_path) {
                std::cout << "Saved: " << *job.saved_path << " ("
                          << linkfetch::ProgressPanel::formatSize(job.bytes_downloaded) << ")"
                          << std::endl;
            }
        }
        return failed == 0 ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
