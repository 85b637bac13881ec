#include "clinfuse/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

#include "clinfuse/common.hpp"

namespace clinfuse {

namespace {

namespace fs = std::filesystem;

std::string utc_now() {
    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[40];
    const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buffer + written, sizeof(buffer) - written, ".%03lldZ", static_cast<long long>(millis));
    return buffer;
}

// Append-only file that shifts `path` to `path.1`, `path.1` to `path.2` and so
// on once it grows past max_bytes. Rotation is off when either limit is zero.
class RotatingFile {
public:
    RotatingFile(std::string path, std::uintmax_t max_bytes, int backups)
        : path_(std::move(path)), max_bytes_(max_bytes), backups_(backups) {
        open();
    }

    bool is_open() const { return stream_.is_open(); }

    void write(const std::string& line) {
        if (max_bytes_ > 0 && backups_ > 0 && written_ + line.size() > max_bytes_ && written_ > 0) {
            rotate();
        }
        stream_ << line;
        stream_.flush();
        written_ += line.size();
    }

private:
    void open() {
        std::error_code ec;
        written_ = fs::exists(path_, ec) ? fs::file_size(path_, ec) : 0;
        if (ec) {
            written_ = 0;
        }
        stream_.open(path_, std::ios::app | std::ios::binary);
    }

    void rotate() {
        stream_.close();
        std::error_code ec;
        fs::remove(path_ + "." + std::to_string(backups_), ec);
        for (int index = backups_ - 1; index >= 1; --index) {
            const auto source = path_ + "." + std::to_string(index);
            if (fs::exists(source, ec)) {
                fs::rename(source, path_ + "." + std::to_string(index + 1), ec);
            }
        }
        fs::rename(path_, path_ + ".1", ec);
        open();
    }

    std::string path_;
    std::uintmax_t max_bytes_;
    int backups_;
    std::uintmax_t written_ = 0;
    std::ofstream stream_;
};

class LogSink {
public:
    void configure(const LoggingConfig& config) {
        const auto level = log_level_from_string(config.level);
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
        json_ = config.json;
        file_.reset();
        if (!config.log_file.has_value()) {
            return;
        }
        file_.emplace(*config.log_file, static_cast<std::uintmax_t>(std::max(config.max_bytes, 0)),
                      config.backup_count);
        if (!file_->is_open()) {
            std::clog << "clinfuse: unable to open log file " << *config.log_file << ", logging to stderr\n";
            file_.reset();
        }
    }

    void emit(LogLevel level, const std::string& logger, const std::string& event, const LogFields& context,
              const LogFields& fields) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(level_)) {
            return;
        }
        std::string line;
        if (json_) {
            nlohmann::json record{
                {"ts", utc_now()}, {"level", to_string(level)}, {"logger", logger}, {"event", event}};
            for (const auto* source : {&context, &fields}) {
                for (const auto& [key, value] : *source) {
                    record[key] = value;
                }
            }
            line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        } else {
            line = utc_now() + " " + to_string(level) + " [" + logger + "] " + event;
            for (const auto* source : {&context, &fields}) {
                for (const auto& [key, value] : *source) {
                    line += " " + key + "=" + value;
                }
            }
        }
        line += '\n';
        if (file_.has_value()) {
            file_->write(line);
        } else {
            std::clog << line << std::flush;
        }
    }

private:
    std::mutex mutex_;
    LogLevel level_ = LogLevel::kInfo;
    bool json_ = true;
    std::optional<RotatingFile> file_;
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

}  // namespace

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
    }
    return "INFO";
}

LogLevel log_level_from_string(const std::string& value) {
    const auto upper = to_upper(trim(value));
    if (upper == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (upper == "INFO") {
        return LogLevel::kInfo;
    }
    if (upper == "WARN" || upper == "WARNING") {
        return LogLevel::kWarn;
    }
    if (upper == "ERROR") {
        return LogLevel::kError;
    }
    throw ConfigError("unknown log level: " + value);
}

Logger::Logger(std::string name, LogFields context) : name_(std::move(name)), context_(std::move(context)) {}

void Logger::log(LogLevel level, const std::string& event, const LogFields& fields) const {
    sink().emit(level, name_, event, context_, fields);
}

void Logger::debug(const std::string& event, const LogFields& fields) const {
    log(LogLevel::kDebug, event, fields);
}

void Logger::info(const std::string& event, const LogFields& fields) const {
    log(LogLevel::kInfo, event, fields);
}

void Logger::warn(const std::string& event, const LogFields& fields) const {
    log(LogLevel::kWarn, event, fields);
}

void Logger::error(const std::string& event, const LogFields& fields) const {
    log(LogLevel::kError, event, fields);
}

Logger Logger::with(const LogFields& fields) const {
    auto context = context_;
    for (const auto& [key, value] : fields) {
        context[key] = value;
    }
    return Logger(name_, std::move(context));
}

void configure_logging(const LoggingConfig& config) {
    sink().configure(config);
}

Logger get_logger(const std::string& name) {
    return Logger(name);
}

}  // namespace clinfuse
