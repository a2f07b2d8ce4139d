// =============================================================================
// seqcov - Logger Module Implementation
// =============================================================================

#include "seqcov/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace seqcov::log {

namespace {

constexpr const char* kLoggerName = "seqcov";

/// @brief Global logger; nullptr while logging is off.
std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gInitMutex;

std::shared_ptr<quill::Sink> stderrSink() {
    quill::ConsoleSinkConfig consoleConfig;
    consoleConfig.set_stream("stderr");
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console", consoleConfig);
}

}  // namespace

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
    return quill::LogLevel::Info;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileSinkConfig;
        fileSinkConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileSinkConfig, quill::FileEventNotifier{}));
    }
    // stdout carries the report; errors always need somewhere to go
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(stderrSink());
    }

    quill::Logger* loggerPtr = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));
    gLogger.store(loggerPtr, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* loggerPtr = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (loggerPtr != nullptr) {
        loggerPtr->flush_log();
        quill::Backend::stop();
    }
}

}  // namespace seqcov::log
