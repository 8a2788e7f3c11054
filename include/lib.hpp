#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

// Named stderr logger shared by the whole engine. Nothing in the engine
// writes to stdout.
std::shared_ptr<spdlog::logger> mlog();

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(mlog(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(mlog(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(mlog(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(mlog(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(mlog(), __VA_ARGS__)

// Formats the message, logs the call site and throws E(message).
template <class E, class... Args>
[[noreturn]] void error(const char* file, int line, fmt::format_string<Args...> msg, Args&&... args) {
    std::string text = fmt::format(msg, std::forward<Args>(args)...);
    LOG_DEBUG("{}:{}: {}", file, line, text);
    throw E(text);
}

// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW(...) error<std::runtime_error>(__FILE__, __LINE__, __VA_ARGS__)
#define THROW_AS(E, ...) error<E>(__FILE__, __LINE__, __VA_ARGS__)

// small string helpers used across the engine
std::string to_upper(std::string s);
std::string to_lower(std::string s);
std::string trim(const std::string& s);
bool starts_with_ci(const std::string& s, const std::string& prefix);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
