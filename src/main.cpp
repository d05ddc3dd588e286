#include "../include/crawl_summary/SummaryConfig.h"
#include "../include/crawl_summary/SummaryPipeline.h"
#include "../include/crawl_summary/log/CrawlLogReader.h"
#include "../include/crawl_summary/summary/CrawlSummary.h"
#include "../include/Logger.h"

#include <csignal>
#include <execinfo.h>
#include <iostream>
#include <unistd.h>

// Crash handler to log a backtrace on segfaults
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        backtrace_symbols_fd(array, size, STDERR_FILENO);
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

int main(int argc, char** argv) {
    installCrashHandler();

    const std::string program = argc > 0 ? argv[0] : "crawl-summary";

    crawl_summary::SummaryConfig config;
    try {
        config = crawl_summary::loadConfig(argc, argv);
    } catch (const crawl_summary::ConfigError& e) {
        std::cerr << e.what() << "\n\n" << crawl_summary::usage(program);
        return 2;
    }

    if (config.showHelp) {
        std::cout << crawl_summary::usage(program);
        return 0;
    }

    Logger::getInstance().init(config.logLevel, true, config.logFile);

    try {
        const auto suffixes = crawl_summary::loadPublicSuffixList(config);
        const auto document = crawl_summary::summarizeCrawlLog(config, suffixes);
        // Raw URL bytes are not always valid UTF-8
        std::cout << document.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << std::endl;
    } catch (const crawl_summary::summary::SeedIntegrityError& e) {
        LOG_ERROR(std::string(e.what()) + ": the summary pass met a record the seed pass never registered, aborting");
        return 1;
    } catch (const crawl_summary::log::CrawlLogError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const crawl_summary::common::PublicSuffixListError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unexpected failure: ") + e.what());
        return 1;
    }

    if (size_t warnings = Logger::getInstance().messageCount(LogLevel::WARNING); warnings > 0) {
        LOG_INFO_STREAM("Finished with " << warnings << " warnings");
    }
    return 0;
}
