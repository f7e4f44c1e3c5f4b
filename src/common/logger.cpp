// =============================================================================
// frw - Logger Module Implementation
// =============================================================================

#include "frw/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace frw::log {

namespace {

constexpr const char* kLoggerName = "frw";

// Written under gInitMutex, read lock-free by the logging macros
std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gInitMutex;

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Warning;
}

/// @brief Create the logger. Caller holds gInitMutex.
quill::Logger* createLogger(std::string_view logFile) {
    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));

    if (!logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            std::string(logFile), fileConfig, quill::FileEventNotifier{}));
    }

    return quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
}

}  // namespace

std::optional<Level> levelFromString(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "info") {
        return Level::kInfo;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    if (lower == "critical" || lower == "fatal") {
        return Level::kCritical;
    }
    return std::nullopt;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
    }
    return "warning";
}

void init(std::string_view logFile, Level level) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr == nullptr) {
        loggerPtr = createLogger(logFile);
    }
    loggerPtr->set_log_level(toQuillLevel(level));
    gLogger.store(loggerPtr, std::memory_order_release);
}

quill::Logger* logger() {
    if (quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire)) {
        return loggerPtr;
    }

    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr == nullptr) {
        loggerPtr = createLogger({});
        loggerPtr->set_log_level(toQuillLevel(Level::kWarning));
        gLogger.store(loggerPtr, std::memory_order_release);
    }
    return loggerPtr;
}

quill::Logger* existingLogger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return existingLogger() != nullptr;
}

void warnFromDestructor(std::string_view what, std::string_view path,
                        std::string_view reason) noexcept {
    try {
        if (quill::Logger* loggerPtr = existingLogger()) {
            LOG_WARNING(loggerPtr, "{} {}: {}", what, path, reason);
        } else {
            fmt::print(stderr, "frw: {} {}: {}\n", what, path, reason);
        }
    } catch (const std::exception& e) {
        std::fputs("frw: a warning could not be written: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);

    quill::Logger* loggerPtr = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (loggerPtr != nullptr) {
        loggerPtr->flush_log();
        quill::Backend::stop();
    }
}

}  // namespace frw::log
