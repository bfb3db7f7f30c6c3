#include "tooldock/logger.hpp"
#include "tooldock/version.hpp"
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace tooldock {

namespace {

// 2024-05-01 13:37:00.042
std::string timestampNow() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    const std::time_t secs = system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&secs, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis.count();
    return out.str();
}

// Short stable tag for the calling thread, enough to tell concurrent
// commands apart in one session log.
std::string threadTag() {
    const size_t h = std::hash<std::thread::id>{}(std::this_thread::get_id());
    std::ostringstream out;
    out << 't' << std::hex << std::setw(4) << std::setfill('0') << (h & 0xffff);
    return out.str();
}

std::string formatRecord(LogLevel level, const std::string& message) {
    return "[" + timestampNow() + "] [" + logLevelLabel(level) + "] [" + threadTag() + "] " +
           message;
}

} // namespace

const char* logLevelLabel(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

bool Logger::init(const std::filesystem::path& logPath, bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    echoThreshold_ = verbose ? LogLevel::DEBUG : LogLevel::WARNING;

    if (logFile_.is_open()) logFile_.close();

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }
    logFile_.open(logPath, std::ios::out | std::ios::app);
    if (!logFile_) {
        std::cerr << formatRecord(LogLevel::ERROR, "Failed to open log file " + logPath.string())
                  << std::endl;
        return false;
    }

    logFile_ << "\n=== tooldock " << TOOLDOCK_VERSION_STRING << " session started "
             << timestampNow() << " ===\n";
    logFile_.flush();
    return true;
}

void Logger::log(LogLevel level, const std::string& message) {
    const std::string record = formatRecord(level, message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_ << record << '\n';
        // keep the tail of the file useful if the process dies mid command
        if (level >= LogLevel::WARNING) logFile_.flush();
    }
    if (level >= echoThreshold_) {
        std::cerr << record << std::endl;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logFile_.is_open()) return;
    logFile_ << "=== session ended " << timestampNow() << " ===\n";
    logFile_.close();
}

Logger::~Logger() {
    if (logFile_.is_open()) logFile_.close();
}

} // namespace tooldock
