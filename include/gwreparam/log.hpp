#pragma once

/// @file include/gwreparam/log.hpp
/// @brief Minimal {fmt}-based diagnostic logger.
///
/// Info and debug lines are emitted only when the owning component was
/// configured with `verbose = true`; warnings are always written. All output
/// goes to stderr as `[gwreparam:<scope>] <message>`.

#include <fmt/core.h>

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

namespace gwreparam {

class Logger {
public:
    explicit Logger(std::string_view scope, bool verbose = false)
        : scope_(scope), verbose_(verbose) {}

    [[nodiscard]] bool verbose() const noexcept { return verbose_; }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) const {
        if (verbose_) {
            emit("info", fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) const {
        if (verbose_) {
            emit("debug", fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) const {
        emit("warn", fmt::format(format, std::forward<Args>(args)...));
    }

private:
    void emit(std::string_view level, const std::string& message) const {
        fmt::print(stderr, "[gwreparam:{}] {}: {}\n", scope_, level, message);
    }

    std::string scope_;
    bool        verbose_;
};

} // namespace gwreparam
