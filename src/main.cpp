#include <iostream>
#include <iterator>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <string>
#include <vector>
#include "../config/Config.hpp"
#include "core/BioChecker.hpp"
#include "core/ProfileFetcher.hpp"
#include "core/RequestHandler.hpp"
#include "network/HTMLFetcher.hpp"
#include "utils/Logger.hpp"

namespace {

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] <username> <code>\n"
              << "       " << program << " [--config <path>] --stdin\n"
              << "\n"
              << "Checks whether <code> appears in the public bio of @<username>.\n"
              << "--stdin reads a JSON request body {\"username\": ..., \"code\": ...}.\n"
              << "The JSON response is written to stdout; logs go to stderr.\n";
}

int ExitCodeFor(int status) {
    switch (status) {
        case 200: return 0;
        case 400: return 2;
        default:  return 1;
    }
}

}

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        BioVerify::Logger::Log(BioVerify::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }

    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    std::string config_path_str = (exe_dir / "config" / "config.json").string();
    bool read_stdin = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                PrintUsage(argv[0]);
                return 1;
            }
            config_path_str = argv[++i];
        } else if (arg == "--stdin") {
            read_stdin = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (read_stdin ? !positional.empty() : positional.size() != 2) {
        PrintUsage(argv[0]);
        return 2;
    }

    // Load Config. A missing file is created with defaults and the run continues.
    auto& config = BioVerify::Config::GetInstance();
    try {
        config.Load(config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") != std::string::npos) {
            BioVerify::Logger::Log(BioVerify::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            try {
                config.CreateDefault(config_path_str);
            } catch (const std::exception& create_e) {
                BioVerify::Logger::Log(BioVerify::LogLevel::Warn, "Failed to create default config: " + std::string(create_e.what()));
            }
        } else {
            BioVerify::Logger::Log(BioVerify::LogLevel::Error, "Failed to load config: " + error_message);
            return 1;
        }
    }
    BioVerify::Logger::Init(config.log_dir, BioVerify::Logger::FromString(config.log_level));
    BioVerify::Logger::Log(BioVerify::LogLevel::Debug, "Configuration loaded from: " + config_path_str);

    // Initialize global resources
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        BioVerify::Logger::Log(BioVerify::LogLevel::Error, "Failed to initialize libcurl");
        return 1;
    }

    BioVerify::HTMLFetcher html_fetcher;
    BioVerify::ProfileFetcher profile_fetcher(html_fetcher);
    BioVerify::BioChecker checker(profile_fetcher, BioVerify::BioChecker::RetryPolicy::FromConfig(config));
    BioVerify::RequestHandler handler(checker);

    BioVerify::Response response;
    if (read_stdin) {
        std::string body((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        response = handler.HandleJson(body);
    } else {
        response = handler.Handle(positional[0], positional[1]);
    }

    // Bios are scraped text; never fail the response over invalid UTF-8.
    std::cout << response.body.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;

    // Cleanup global resources
    curl_global_cleanup();
    return ExitCodeFor(response.status);
}
