// log.cpp - implementation of logger_t

#include <stdexcept>
#include <utility>
#include "mdaio/log.hpp"

namespace mdaio {

auto to_string(log_level level) -> const char* {
    switch (level) {
        case log_level::debug: return "debug";
        case log_level::info: return "info";
        case log_level::warning: return "warning";
        case log_level::error: return "error";
    }
    return "unknown";
}

auto from_string(std::type_identity<log_level>, const std::string& s) -> log_level {
    if (s == "debug") return log_level::debug;
    if (s == "info") return log_level::info;
    if (s == "warning") return log_level::warning;
    if (s == "error") return log_level::error;
    throw std::runtime_error("invalid log_level: " + s);
}

namespace {

auto label(log_level level) -> const char* {
    switch (level) {
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warning: return "WARNING";
        case log_level::error: return "ERROR";
    }
    return "?";
}

} // namespace

logger_t::logger_t(std::ostream& os, log_level threshold, std::string name)
    : stream_(&os), threshold_(threshold), name_(std::move(name)) {}

void logger_t::open(const std::string& filename) {
    file_.emplace(filename, std::ios::app);
    if (!*file_) {
        file_.reset();
        throw std::runtime_error("cannot open log file '" + filename + "'");
    }
}

auto logger_t::enabled(log_level level) const -> bool {
    return (stream_ || file_) && level >= threshold_;
}

void logger_t::log(log_level level, const std::string& message) {
    if (!enabled(level)) return;
    auto line = std::string(label(level)) + " - " + name_ + " - " + message + "\n";
    if (stream_) {
        *stream_ << line;
        stream_->flush();
    }
    if (file_) {
        *file_ << line;
        file_->flush();
    }
}

} // namespace mdaio
