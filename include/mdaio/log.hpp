#pragma once

#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>

namespace mdaio {

// =============================================================================
// Log levels (ADL to_string / from_string for the config format)
// =============================================================================

enum class log_level { debug, info, warning, error };

auto to_string(log_level level) -> const char*;
auto from_string(std::type_identity<log_level>, const std::string& s) -> log_level;

// =============================================================================
// logger_t - explicitly constructed logging handle
// =============================================================================
//
// Lines are written as "LEVEL - name - message" to an attached stream and,
// when opened, to a log file. A default-constructed logger is silent.
// Components take a logger_t& rather than reaching for a global one.
//
// =============================================================================

class logger_t {
public:
    logger_t() = default;
    explicit logger_t(std::ostream& os, log_level threshold = log_level::info, std::string name = "mdaio");

    logger_t(const logger_t&) = delete;
    logger_t& operator=(const logger_t&) = delete;

    void attach(std::ostream& os) { stream_ = &os; }
    void open(const std::string& filename);

    void set_level(log_level level) { threshold_ = level; }
    auto level() const -> log_level { return threshold_; }
    auto enabled(log_level level) const -> bool;

    void log(log_level level, const std::string& message);
    void debug(const std::string& message) { log(log_level::debug, message); }
    void info(const std::string& message) { log(log_level::info, message); }
    void warning(const std::string& message) { log(log_level::warning, message); }
    void error(const std::string& message) { log(log_level::error, message); }

private:
    std::ostream* stream_ = nullptr;
    std::optional<std::ofstream> file_;
    log_level threshold_ = log_level::info;
    std::string name_ = "mdaio";
};

} // namespace mdaio
