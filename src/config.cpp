#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <stdexcept>

namespace {
unsigned ParseUnsigned(const std::string &what, const std::string &value, unsigned min,
                       unsigned max) {
    size_t pos = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &pos);
    } catch (const std::exception &) {
        throw std::invalid_argument(what + " must be a number, got '" + value + "'");
    }
    if (pos != value.size() || value[0] == '-' || parsed < min || parsed > max) {
        throw std::invalid_argument(what + " must be between " + std::to_string(min) + " and " +
                                    std::to_string(max) + ", got '" + value + "'");
    }
    return static_cast<unsigned>(parsed);
}

const char *GetEnv(const char *name) {
    const char *value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}
} // namespace

// ─────────────────────────────────────
std::filesystem::path DefaultDBPath() {
    std::filesystem::path baseDir;
    if (const char *xdgDataHome = GetEnv("XDG_DATA_HOME")) {
        baseDir = xdgDataHome;
    } else if (const char *home = GetEnv("HOME")) {
        baseDir = std::filesystem::path(home) / ".local" / "share";
    } else {
        std::error_code ec;
        baseDir = std::filesystem::current_path(ec);
        if (ec) {
            throw std::invalid_argument("cannot determine a data directory (HOME unset and " +
                                        ec.message() + "); pass --db");
        }
    }
    return baseDir / "habitual" / "habits.sqlite";
}

// ─────────────────────────────────────
LogLevel ParseLogLevel(const std::string &name) {
    if (name == "debug") {
        return LOG_DEBUG;
    }
    if (name == "info") {
        return LOG_INFO;
    }
    if (name == "off") {
        return LOG_OFF;
    }
    throw std::invalid_argument("unknown log level '" + name + "' (debug, info, off)");
}

// ─────────────────────────────────────
void ApplyLogLevel(LogLevel level) {
    if (level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

// ─────────────────────────────────────
Config ParseConfig(int argc, const char *const argv[]) {
    Config config;
    bool dbGiven = false;

    if (const char *host = GetEnv("HABITUAL_HOST")) {
        config.host = host;
    }
    if (const char *port = GetEnv("HABITUAL_PORT")) {
        config.port = ParseUnsigned("HABITUAL_PORT", port, 0, 65535);
    }
    if (const char *db = GetEnv("HABITUAL_DB_PATH")) {
        config.dbPath = db;
        dbGiven = true;
    }
    if (const char *level = GetEnv("HABITUAL_LOG_LEVEL")) {
        config.logLevel = ParseLogLevel(level);
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.help = true;
        } else if (arg == "--migrate") {
            config.migrate = true;
        } else if (arg == "--host") {
            config.host = value();
        } else if (arg == "--port") {
            config.port = ParseUnsigned("--port", value(), 0, 65535);
        } else if (arg == "--db") {
            config.dbPath = value();
            dbGiven = true;
        } else if (arg == "--log-level") {
            config.logLevel = ParseLogLevel(value());
        } else if (arg == "--threads") {
            config.threads = ParseUnsigned("--threads", value(), 1, 256);
        } else {
            throw std::invalid_argument("unknown option '" + arg + "'");
        }
    }

    if (config.host.empty()) {
        throw std::invalid_argument("host must not be empty");
    }
    if (!dbGiven) {
        config.dbPath = DefaultDBPath();
    } else if (config.dbPath.empty()) {
        throw std::invalid_argument("database path must not be empty");
    }
    return config;
}

// ─────────────────────────────────────
std::string Usage(const std::string &program) {
    return "Usage: " + program +
           " [options]\n"
           "  --host <addr>        listen address (HABITUAL_HOST, default 127.0.0.1)\n"
           "  --port <n>           listen port (HABITUAL_PORT, default 8000)\n"
           "  --db <path>          SQLite database file (HABITUAL_DB_PATH)\n"
           "  --log-level <level>  debug, info or off (HABITUAL_LOG_LEVEL, default info)\n"
           "  --threads <n>        request worker threads (default 4)\n"
           "  --migrate            create the database schema and exit\n"
           "  -h, --help           show this help\n";
}
