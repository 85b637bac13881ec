#ifndef CLINFUSE_LOGGING_HPP
#define CLINFUSE_LOGGING_HPP

#include <map>
#include <string>

#include "clinfuse/config.hpp"

namespace clinfuse {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

std::string to_string(LogLevel level);
// Accepts DEBUG, INFO, WARN/WARNING and ERROR in any case; throws ConfigError otherwise.
LogLevel log_level_from_string(const std::string& value);

using LogFields = std::map<std::string, std::string>;

// Events are snake_case keys; details travel in `fields`, never in the key.
class Logger {
public:
    explicit Logger(std::string name, LogFields context = {});

    void log(LogLevel level, const std::string& event, const LogFields& fields = {}) const;
    void debug(const std::string& event, const LogFields& fields = {}) const;
    void info(const std::string& event, const LogFields& fields = {}) const;
    void warn(const std::string& event, const LogFields& fields = {}) const;
    void error(const std::string& event, const LogFields& fields = {}) const;

    // Copy of this logger that stamps `fields` on every event.
    Logger with(const LogFields& fields) const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
    LogFields context_;
};

void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

}  // namespace clinfuse

#endif  // CLINFUSE_LOGGING_HPP
