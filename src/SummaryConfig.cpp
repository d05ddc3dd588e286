#include "../include/crawl_summary/SummaryConfig.h"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace crawl_summary {

namespace {

size_t parseCount(std::string_view option, std::string_view value) {
    size_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        throw ConfigError(std::string(option) + " expects a non-negative integer, got '" + std::string(value) + "'");
    }
    return result;
}

LogLevel parseLogLevel(std::string_view source, const std::string& value) {
    auto level = Logger::parseLevel(value);
    if (!level) {
        throw ConfigError(std::string(source) + " must be one of trace, debug, info, warning, error, none; got '" + value + "'");
    }
    return *level;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

SummaryConfig loadConfig(int argc, const char* const* argv) {
    SummaryConfig config;

    if (const char* level = env("CRAWL_SUMMARY_LOG_LEVEL")) {
        config.logLevel = parseLogLevel("CRAWL_SUMMARY_LOG_LEVEL", level);
    }
    if (const char* file = env("CRAWL_SUMMARY_LOG_FILE")) {
        config.logFile = file;
    }
    if (const char* psl = env("PUBLIC_SUFFIX_LIST")) {
        config.publicSuffixListPath = psl;
    }

    bool optionsDone = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto requireValue = [&](const std::string& option) -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("Option " + option + " requires a value");
            }
            return argv[++i];
        };

        if (!optionsDone && arg.size() > 1 && arg[0] == '-') {
            if (arg == "--") {
                optionsDone = true;
            } else if (arg == "-h" || arg == "--help") {
                config.showHelp = true;
            } else if (arg == "-g" || arg == "--group-by") {
                const std::string value = requireValue(arg);
                auto groupBy = summary::parseGroupBy(value);
                if (!groupBy) {
                    throw ConfigError(arg + " must be none, host, registered-domain or seed; got '" + value + "'");
                }
                config.groupBy = *groupBy;
            } else if (arg == "-n" || arg == "--top") {
                config.topN = parseCount(arg, requireValue(arg));
            } else if (arg == "--max-depth") {
                config.maxResolveDepth = parseCount(arg, requireValue(arg));
                if (config.maxResolveDepth == 0) {
                    throw ConfigError("--max-depth must be at least 1");
                }
            } else if (arg == "--public-suffix-list") {
                config.publicSuffixListPath = requireValue(arg);
            } else if (arg == "--log-level") {
                config.logLevel = parseLogLevel(arg, requireValue(arg));
            } else if (arg == "--log-file") {
                config.logFile = requireValue(arg);
            } else {
                throw ConfigError("Unknown option: " + arg);
            }
            continue;
        }

        if (!config.logPath.empty()) {
            throw ConfigError("Only one crawl log may be given (got '" + config.logPath + "' and '" + arg + "')");
        }
        config.logPath = arg;
    }

    if (config.logPath.empty() && !config.showHelp) {
        throw ConfigError("Missing crawl log path");
    }
    return config;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options...] crawl.log\n"
           "\n"
           "Summarizes a Heritrix crawl log as JSON on stdout.\n"
           "\n"
           "Options:\n"
           "  -g, --group-by {none,host,registered-domain,seed}\n"
           "                               Group the summary by host, registered domain or seed\n"
           "  -n, --top N                  Limit status codes, mime types and registered domains to the top N\n"
           "      --max-depth N            Seed resolution step ceiling per URL (default 50)\n"
           "      --public-suffix-list PATH\n"
           "                               public_suffix_list.dat to use (env PUBLIC_SUFFIX_LIST)\n"
           "      --log-level LEVEL        trace, debug, info, warning, error or none (env CRAWL_SUMMARY_LOG_LEVEL)\n"
           "      --log-file PATH          Also append diagnostics to PATH (env CRAWL_SUMMARY_LOG_FILE)\n"
           "  -h, --help                   Show this help\n";
}

} // namespace crawl_summary
