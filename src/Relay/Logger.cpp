// =================================================================
// src/Relay/Logger.cpp
// =================================================================
// Implementation for the routing core logging system.

#include "Relay/Logger.hpp"
#include <algorithm>
#include <ctime>
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Relay {

namespace {

const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";
        case LogLevel::INFO: return "\033[36m";
        case LogLevel::WARNING: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::CRITICAL: return "\033[1;91m";
    }
    return "\033[0m";
}

std::tm toLocalTime(std::chrono::system_clock::time_point time_point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    std::tm local{};
    localtime_r(&seconds, &local);
    return local;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LogSettings& settings) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings = settings;
    m_file.reset();
    m_file_path.clear();
    m_file_bytes = 0;
    m_file_failed = false;
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.console_enabled = enabled;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& context) {
    LogEntry entry{std::chrono::system_clock::now(), level, component, message, context};

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_settings.console_enabled && level >= m_settings.console_level) {
        emitConsole(entry);
    }
    if (level >= m_settings.file_level) {
        if (m_pending.size() >= m_settings.max_pending_lines && !m_pending.empty()) {
            m_pending.pop_front();
            m_dropped++;
        }
        m_pending.push_back(render(entry, false));
    }
}

void Logger::logRoutingDecision(const std::string& request_id, const std::string& provider,
                                const std::string& algorithm, double score, bool fallback_used) {
    std::ostringstream context;
    context << "request=" << request_id
            << " algorithm=" << algorithm
            << " score=" << std::fixed << std::setprecision(3) << score;

    if (fallback_used) {
        warning("RoutingEngine", "Fallback to " + provider + ", no provider met every requirement",
                context.str());
    } else {
        debug("RoutingEngine", "Routed to " + provider, context.str());
    }
}

void Logger::logRequestOutcome(const std::string& request_id, const std::string& provider,
                               double duration_ms, bool success) {
    std::ostringstream context;
    context << "provider=" << provider
            << " duration=" << std::fixed << std::setprecision(1) << duration_ms << "ms";

    log(success ? LogLevel::DEBUG : LogLevel::WARNING, "RequestTracker",
        "Request " + request_id + (success ? " completed" : " failed"), context.str());
}

void Logger::logAlert(const std::string& severity, const std::string& subject, const std::string& message) {
    LogLevel level = LogLevel::INFO;
    if (severity == "CRITICAL") {
        level = LogLevel::CRITICAL;
    } else if (severity == "HIGH") {
        level = LogLevel::ERROR;
    } else if (severity == "MEDIUM") {
        level = LogLevel::WARNING;
    }

    log(level, "AlertEngine", message, "subject=" + subject + " severity=" + severity);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    if (m_dropped > 0) {
        writeLine("[WARN] Logger: " + std::to_string(m_dropped) + " buffered lines dropped");
        m_dropped = 0;
    }
    for (const auto& line : m_pending) {
        writeLine(line);
    }
    m_pending.clear();
    
    if (m_file) {
        m_file->flush();
    }
    std::cout.flush();
}

size_t Logger::pendingLines() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

std::string Logger::currentLogFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_file_path;
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
    }
    return "UNKNOWN";
}

void Logger::emitConsole(const LogEntry& entry) const {
    std::ostream& out = entry.level >= LogLevel::ERROR ? std::cerr : std::cout;
    out << render(entry, true) << '\n';
}

void Logger::writeLine(const std::string& line) {
    if (m_file_failed) {
        return;
    }
    if (!m_file || m_file_bytes >= m_settings.max_file_bytes) {
        openFile();
        if (!m_file) {
            return;
        }
    }

    *m_file << line << '\n';
    m_file_bytes += line.size() + 1;
}

std::string Logger::render(const LogEntry& entry, bool colored) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()).count() % 1000;
    std::tm local = toLocalTime(entry.timestamp);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setfill('0') << std::setw(3) << ms << ' ';

    std::string tag = "[" + levelName(entry.level) + "]";
    if (colored) {
        line << levelColor(entry.level) << tag << "\033[0m";
    } else {
        line << tag;
    }

    line << ' ' << entry.component << ": " << entry.message;
    if (!entry.context.empty()) {
        line << " (" << entry.context << ")";
    }

    return line.str();
}

void Logger::openFile() {
    m_file.reset();
    m_file_bytes = 0;

    try {
        std::filesystem::create_directories(m_settings.log_dir);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Log directory unavailable, file logging disabled: " << e.what() << std::endl;
        m_file_failed = true;
        return;
    }

    m_file_path = nextFilePath();
    m_file = std::make_unique<std::ofstream>(m_file_path, std::ios::app);
    if (!m_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file " << m_file_path << ", file logging disabled" << std::endl;
        m_file.reset();
        m_file_failed = true;
        return;
    }

    pruneOldFiles();
}

void Logger::pruneOldFiles() {
    namespace fs = std::filesystem;

    try {
        std::vector<fs::path> files;
        for (const auto& item : fs::directory_iterator(m_settings.log_dir)) {
            const auto& path = item.path();
            if (item.is_regular_file() && path.extension() == ".log" &&
                path.filename().string().rfind("relay_", 0) == 0) {
                files.push_back(path);
            }
        }
        if (files.size() <= m_settings.max_files) {
            return;
        }

        // Names embed the creation time, so lexical order is age order
        std::sort(files.begin(), files.end());
        size_t excess = files.size() - m_settings.max_files;
        for (size_t i = 0; i < excess; i++) {
            if (files[i].string() != m_file_path) {
                fs::remove(files[i]);
            }
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::nextFilePath() {
    std::tm local = toLocalTime(std::chrono::system_clock::now());

    std::ostringstream path;
    path << m_settings.log_dir << "/relay_" << std::put_time(&local, "%Y%m%d_%H%M%S");
    // Rotation can happen several times within one second
    path << '_' << std::setfill('0') << std::setw(3) << m_file_sequence++ << ".log";
    return path.str();
}

} // namespace Relay
