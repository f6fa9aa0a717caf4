/**
 * xsys Logger
 *
 * File-based logging for compiler runs.
 * Logs to ~/.xsys/xsys.log (or the configured log_dir) with timestamps and rotation.
 */

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <mutex>
#include <cstdint>
#include <cstdlib>
#include <ctime>

namespace xsys {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR,    // Named ERR to avoid Windows ERROR macro conflict
        FATAL
    };

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * Open the log file. Until this succeeds every log call is a no-op.
     */
    bool init(const std::string& log_dir = "", bool debug = false) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string dir = expand_home(log_dir);
        if (dir.empty()) {
            const char* home = nullptr;
#ifdef _WIN32
            home = std::getenv("USERPROFILE");
#else
            home = std::getenv("HOME");
#endif
            dir = home ? std::string(home) + "/.xsys" : ".";
        }

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return false;
        }

        log_path_ = dir + "/xsys.log";

        // Rotate log if too large (> 10MB)
        if (std::filesystem::exists(log_path_, ec)) {
            auto size = std::filesystem::file_size(log_path_, ec);
            if (!ec && size > MAX_LOG_BYTES) {
                std::string backup = log_path_ + ".old";
                std::filesystem::remove(backup, ec);
                std::filesystem::rename(log_path_, backup, ec);
            }
        }

        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }

        initialized_ = true;
        debug_ = debug;

        // Write directly, we already hold the mutex
        log_file_ << timestamp() << " [INFO ] === xsys Logger Started ===\n";
        log_file_.flush();

        return true;
    }

    void log(Level level, const std::string& message) {
        if (!initialized_) return;
        if (level == Level::DEBUG && !debug_) return;

        std::lock_guard<std::mutex> lock(mutex_);

        log_file_ << timestamp() << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();
    }

    void log_startup(const std::string& version, const std::string& input, const std::string& mode) {
        std::stringstream ss;
        ss << "STARTUP: Version=" << version
           << ", Input=" << input
           << ", Mode=" << mode;
        log(Level::INFO, ss.str());
    }

    void log_parsed(const std::string& input, size_t statements, size_t results,
                    size_t rules, const std::string& fingerprint) {
        std::stringstream ss;
        ss << "PARSED: " << input
           << ", Statements=" << statements
           << ", Results=" << results
           << ", Rules=" << rules
           << ", Fingerprint=" << fingerprint;
        log(Level::INFO, ss.str());
    }

    void log_generated(const std::string& output_file, const std::string& type, size_t bytes) {
        std::stringstream ss;
        ss << "GENERATED: " << output_file
           << ", Type=" << type
           << ", Bytes=" << bytes;
        log(Level::INFO, ss.str());
    }

    void log_error(const std::string& error_msg) {
        log(Level::ERR, "ERROR: " + error_msg);
    }

    void log_shutdown(const std::string& reason, double elapsed_ms) {
        std::stringstream ss;
        ss << "SHUTDOWN: Reason=" << reason
           << ", ElapsedMs=" << std::fixed << std::setprecision(1) << elapsed_ms;
        log(Level::INFO, ss.str());
    }

    std::string get_log_path() const { return log_path_; }
    bool is_initialized() const { return initialized_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== xsys Logger Stopped ===");
            log_file_.close();
        }
    }

private:
    static constexpr uintmax_t MAX_LOG_BYTES = 10 * 1024 * 1024;

    Logger() : initialized_(false), debug_(false) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string expand_home(const std::string& path) {
        if (path.empty() || path[0] != '~') return path;
        const char* home = std::getenv("HOME");
        return home ? std::string(home) + path.substr(1) : path;
    }

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
            case Level::FATAL: return "FATAL";
            default: return "?????";
        }
    }

    bool initialized_;
    bool debug_;
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Convenience macros
#define XSYS_LOG_INFO(msg)  xsys::Logger::instance().log(xsys::Logger::Level::INFO, msg)
#define XSYS_LOG_WARN(msg)  xsys::Logger::instance().log(xsys::Logger::Level::WARN, msg)
#define XSYS_LOG_ERROR(msg) xsys::Logger::instance().log(xsys::Logger::Level::ERR, msg)
#define XSYS_LOG_DEBUG(msg) xsys::Logger::instance().log(xsys::Logger::Level::DEBUG, msg)

}  // namespace xsys
