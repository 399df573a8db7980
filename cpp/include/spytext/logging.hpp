#ifndef SPYTEXT_LOGGING_HPP
#define SPYTEXT_LOGGING_HPP

#include <map>
#include <string>

#include "spytext/config.hpp"

namespace spytext {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

LogLevel parse_log_level(const std::string& level);
std::string log_level_name(LogLevel level);

class Logger {
public:
    explicit Logger(std::string name);

    const std::string& name() const { return name_; }

    void log(LogLevel level, const std::string& message,
             const std::map<std::string, std::string>& extra = {}) const;

    void debug(const std::string& message,
               const std::map<std::string, std::string>& extra = {}) const;
    void info(const std::string& message,
              const std::map<std::string, std::string>& extra = {}) const;
    void warn(const std::string& message,
              const std::map<std::string, std::string>& extra = {}) const;
    void error(const std::string& message,
               const std::map<std::string, std::string>& extra = {}) const;

private:
    std::string name_;
};

void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

}  // namespace spytext

#endif  // SPYTEXT_LOGGING_HPP
