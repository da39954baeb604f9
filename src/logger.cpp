#include "objdet/logger.hpp"
#include "objdet/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace objdet {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : min_severity_(Severity::kINFO), sink_(&std::cerr) {}

void Logger::setSink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? sink : &std::cerr;
}

void Logger::log(Severity severity, const std::string& msg) {
    if (!enabled(severity)) return;

    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    *sink_ << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << ','
           << std::setw(3) << std::setfill('0') << ms << std::setfill(' ')
           << " - objdet - " << severityName(severity) << " - " << msg << std::endl;
}

const char* severityName(Severity severity) {
    switch (severity) {
        case Severity::kERROR:   return "ERROR";
        case Severity::kWARNING: return "WARNING";
        case Severity::kINFO:    return "INFO";
        case Severity::kVERBOSE: return "VERBOSE";
    }
    return "INFO";
}

Severity parseSeverity(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "error") return Severity::kERROR;
    if (lower == "warning" || lower == "warn") return Severity::kWARNING;
    if (lower == "info") return Severity::kINFO;
    if (lower == "verbose" || lower == "debug") return Severity::kVERBOSE;
    throw ConfigError("Unknown log level: " + name);
}

} // namespace objdet
