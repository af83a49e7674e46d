#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <optional>
#include <climits>

// Usage:
//   auto logger = std::make_shared<Logger>("linewire");
//   logger->add_sink(std::make_shared<StderrSink>());
//   logger->info("connected");
// Build with -DLOGGER_ENABLE_TRACE to get the trace channel:
//   logger->trace("read", "12 bytes");
// Traces are emitted regardless of per-sink log level thresholds.

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
#ifdef LOGGER_ENABLE_TRACE
    , Trace  // Highest so it survives retrieval filters
#endif
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
#ifdef LOGGER_ENABLE_TRACE
        case LogLevel::Trace:    return "TRACE";
#endif
        default:                 return "UNKNOWN";
    }
}

// Accepts the lowercase names used on the command line and in config files.
inline std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "debug")    return LogLevel::Debug;
    if (name == "info")     return LogLevel::Info;
    if (name == "warning")  return LogLevel::Warning;
    if (name == "error")    return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    return std::nullopt;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

#ifdef LOGGER_ENABLE_TRACE
    // Trace bypasses level filtering; default no-op if not overridden.
    virtual void trace(const std::string& id, const std::string& message) {
        (void)id; (void)message;
    }
#endif
protected:
    LogLevel min_level_ = LogLevel::Info;
};

// Writes "[LEVEL] name: message" lines to a std::ostream. Several threads
// (callers and event-loop workers) log concurrently, so writes are serialized.
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[" << to_string(level) << "] " << message << std::endl;
    }
#ifdef LOGGER_ENABLE_TRACE
    void trace(const std::string& id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[TRACE][" << id << "] " << message << std::endl;
    }
#endif
private:
    std::ostream& out_;
    std::mutex mutex_;
};

class StdoutSink : public StreamSink {
public:
    StdoutSink() : StreamSink(std::cout) {}
};

// Keeps stdout free for protocol traffic in the console client.
class StderrSink : public StreamSink {
public:
    StderrSink() : StreamSink(std::cerr) {}
};

// In-memory sink; tests use it to check what a component reported.
class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << "[" << to_string(level) << "] " << message;
        lines_.push_back(oss.str());
        levels_.push_back(level);
    }
#ifdef LOGGER_ENABLE_TRACE
    void trace(const std::string& id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back("[TRACE][" + id + "] " + message);
        levels_.push_back(LogLevel::Trace);
    }
#endif
    std::vector<std::string> get_lines(LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> filtered;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level) filtered.push_back(lines_[i]);
        }
        return filtered;
    }
    // Number of stored lines containing `needle`.
    size_t count_containing(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(lines_.begin(), lines_.end(), [&](const std::string& l) {
            return l.find(needle) != std::string::npos;
        }));
    }
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }
private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

class Logger {
public:
    Logger() : name_("linewire") {}
    explicit Logger(const std::string& name) : name_(name) {}

    // Sinks are expected to be attached during setup, before the logger is
    // shared with other threads.
    void add_sink(std::shared_ptr<LogSink> sink) {
        sinks_.push_back(std::move(sink));
    }

    void log(LogLevel level, const std::string& message) {
        const std::string line = name_ + ": " + message;
        for (const auto& sink : sinks_) {
            sink->log(level, line);
        }
    }

#ifdef LOGGER_ENABLE_TRACE
    void trace(const std::string& id, const std::string& message) {
        for (const auto& sink : sinks_) {
            sink->trace(id, message); // Bypass level filtering
        }
    }
#endif

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    // Apply one threshold to every attached sink.
    void set_level(LogLevel level) {
        for (const auto& sink : sinks_) sink->set_level(level);
    }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};
