#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>

namespace objdet {

// Same ordering as nvinfer1::ILogger::Severity so the TensorRT logger can forward 1:1
enum class Severity {
    kERROR = 1,
    kWARNING = 2,
    kINFO = 3,
    kVERBOSE = 4
};

class Logger {
public:
    static Logger& instance();

    void log(Severity severity, const std::string& msg);

    void setMinSeverity(Severity severity) { min_severity_ = severity; }
    Severity minSeverity() const { return min_severity_; }
    bool enabled(Severity severity) const { return severity <= min_severity_; }

    // Redirect output (tests); nullptr restores std::cerr
    void setSink(std::ostream* sink);

private:
    Logger();

    std::atomic<Severity> min_severity_;
    std::ostream* sink_;
    std::mutex mutex_;
};

const char* severityName(Severity severity);

// "error", "warning", "info", "verbose" (case-insensitive); throws ConfigError otherwise
Severity parseSeverity(const std::string& name);

inline void logError(const std::string& msg) { Logger::instance().log(Severity::kERROR, msg); }
inline void logWarning(const std::string& msg) { Logger::instance().log(Severity::kWARNING, msg); }
inline void logInfo(const std::string& msg) { Logger::instance().log(Severity::kINFO, msg); }
inline void logVerbose(const std::string& msg) { Logger::instance().log(Severity::kVERBOSE, msg); }

} // namespace objdet
