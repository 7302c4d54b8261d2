#pragma once

/// @file game_logger.hpp
/// @brief Per-category engine logging over the kcenon common logger registry.
///
/// Combat, status and skill resolution log every step at Debug; content,
/// config and progression report milestones at Info.  Levels are adjusted
/// at runtime from the `logging:` section of the engine config.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "dqe/foundation/game_result.hpp"

namespace dqe::foundation {

/// Severity, ordered from most to least verbose.  `Off` only ever appears
/// as a threshold, never as the level of an emitted entry.
enum class LogLevel : uint8_t {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical,
    Off
};

/// Subsystem an entry belongs to.  Values index the logger's channel table.
enum class LogCategory : uint8_t {
    Core,        ///< Startup, shutdown and the console front-end
    Combat,      ///< Turn sequencing, damage and encounter outcomes
    Status,      ///< Status effect application, ticks and expiry
    Skill,       ///< Skill validation and resolution
    Progression, ///< Experience awards and level-ups
    Content,     ///< Catalog loading and validation
    Config       ///< Configuration files and environment
};

inline constexpr std::size_t kLogCategoryCount =
    static_cast<std::size_t>(LogCategory::Config) + 1;

namespace detail {

inline constexpr std::array<std::string_view, kLogCategoryCount> kCategoryNames = {
    "Core", "Combat", "Status", "Skill", "Progression", "Content", "Config",
};

inline constexpr std::array<std::string_view, 7> kLevelNames = {
    "TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL", "OFF",
};

} // namespace detail

/// Category name as it appears in the "[Category]" prefix and in config keys.
constexpr std::string_view logCategoryName(LogCategory cat) {
    auto idx = static_cast<std::size_t>(cat);
    return idx < detail::kCategoryNames.size() ? detail::kCategoryNames[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    auto idx = static_cast<std::size_t>(level);
    return idx < detail::kLevelNames.size() ? detail::kLevelNames[idx] : "UNKNOWN";
}

/// Case-insensitive level lookup for config values.  Besides the level
/// names, accepts "warn", "fatal" and "none".
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Fields appended to a message as " {combatant=.., turn=.., key=value}".
/// Empty fields are skipped; `extra` keys follow in sorted order.
struct LogContext {
    std::optional<std::string> combatant;
    std::optional<uint32_t> turn;
    std::map<std::string, std::string> extra;
};

/// Engine logger.  Each category owns a threshold and writes to the
/// registry logger named "dqe.<Category>" when one is registered,
/// otherwise to the registry default.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Ignored for categories outside LogCategory.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// `Off` for categories outside LogCategory.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flushes the registry default logger.
    GameResult<void> flush();

    /// Shared logger behind the DQE_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dqe::foundation

// -- Macros ------------------------------------------------------------------

// Levels below DQE_MIN_LOG_LEVEL (as LogLevel ordinal) are compiled out.
#ifndef DQE_MIN_LOG_LEVEL
    #define DQE_MIN_LOG_LEVEL 0
#endif

#define DQE_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        constexpr bool dqe_log_compiled_ = static_cast<int>(level) >= DQE_MIN_LOG_LEVEL; \
        _Pragma("GCC diagnostic pop")                                             \
        if constexpr (dqe_log_compiled_) {                                        \
            auto& dqe_log_sink_ = ::dqe::foundation::GameLogger::instance();      \
            if (dqe_log_sink_.isEnabled((level), (cat))) {                        \
                dqe_log_sink_.log((level), (cat), (msg));                         \
            }                                                                     \
        }                                                                         \
    } while (0)

#define DQE_LOG_DEBUG(cat, msg)    DQE_LOG(::dqe::foundation::LogLevel::Debug, (cat), (msg))
#define DQE_LOG_INFO(cat, msg)     DQE_LOG(::dqe::foundation::LogLevel::Info, (cat), (msg))
#define DQE_LOG_WARN(cat, msg)     DQE_LOG(::dqe::foundation::LogLevel::Warning, (cat), (msg))
#define DQE_LOG_ERROR(cat, msg)    DQE_LOG(::dqe::foundation::LogLevel::Error, (cat), (msg))
#define DQE_LOG_CRITICAL(cat, msg) DQE_LOG(::dqe::foundation::LogLevel::Critical, (cat), (msg))
