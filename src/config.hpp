#pragma once

#include <filesystem>
#include <string>

#include "common.hpp"

struct Config {
    std::string host = "127.0.0.1";
    unsigned port = 8000;
    std::filesystem::path dbPath;
    LogLevel logLevel = LOG_INFO;
    unsigned threads = 4;
    bool migrate = false;
    bool help = false;
};

// Defaults, then HABITUAL_* environment variables, then flags.
// Throws std::invalid_argument on bad input.
Config ParseConfig(int argc, const char *const argv[]);

std::filesystem::path DefaultDBPath();
LogLevel ParseLogLevel(const std::string &name);
void ApplyLogLevel(LogLevel level);
std::string Usage(const std::string &program);
