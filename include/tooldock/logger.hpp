#ifndef TOOLDOCK_LOGGER_HPP
#define TOOLDOCK_LOGGER_HPP

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace tooldock {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

const char* logLevelLabel(LogLevel level);

// Process wide log. Every record goes to the session file; the console
// (stderr, stdout carries the command protocol) only gets records at or
// above the echo threshold. Records are tagged with the emitting thread
// since commands run concurrently.
class Logger {
public:
    static Logger& instance();

    // Opens the session log and sets the echo threshold (DEBUG when verbose,
    // WARNING otherwise). Returns false if the file could not be opened, in
    // which case only the console sink is active.
    bool init(const std::filesystem::path& logPath, bool verbose);
    void log(LogLevel level, const std::string& message);

    // Writes the closing banner and closes the file sink.
    void shutdown();

    // Forbidden
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::ofstream logFile_;
    LogLevel echoThreshold_ = LogLevel::WARNING;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(msg) tooldock::Logger::instance().log(tooldock::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) tooldock::Logger::instance().log(tooldock::LogLevel::INFO, msg)
#define LOG_WARN(msg) tooldock::Logger::instance().log(tooldock::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) tooldock::Logger::instance().log(tooldock::LogLevel::ERROR, msg)

} // namespace tooldock

#endif // TOOLDOCK_LOGGER_HPP
