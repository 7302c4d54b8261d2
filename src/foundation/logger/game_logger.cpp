/// @file game_logger.cpp
/// @brief Category channels routed to the kcenon logger registry.

#include "dqe/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <string>
#include <utility>

namespace dqe::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

// Indexed by LogLevel.
constexpr std::array<kci::log_level, 7> kBackendLevels = {
    kci::log_level::trace,   kci::log_level::debug, kci::log_level::info,
    kci::log_level::warning, kci::log_level::error, kci::log_level::critical,
    kci::log_level::off,
};

// Indexed by LogCategory.  Turn-level categories are chatty by default.
constexpr std::array<LogLevel, kLogCategoryCount> kInitialLevels = {
    LogLevel::Info,  LogLevel::Debug, LogLevel::Debug, LogLevel::Debug,
    LogLevel::Info,  LogLevel::Info,  LogLevel::Info,
};

kci::log_level toBackend(LogLevel level) {
    auto idx = static_cast<std::size_t>(level);
    return idx < kBackendLevels.size() ? kBackendLevels[idx] : kci::log_level::info;
}

bool sameIgnoringCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::toupper(x) == std::toupper(y);
           });
}

/// "[Category] message" plus " {k=v, ...}" when @p ctx has any field.
std::string renderEntry(LogCategory cat, std::string_view msg, const LogContext* ctx) {
    std::string line;
    line.reserve(msg.size() + 32);
    line.append("[").append(logCategoryName(cat)).append("] ").append(msg);
    if (ctx == nullptr) {
        return line;
    }

    std::string fields;
    auto field = [&fields](std::string_view key, const std::string& value) {
        fields.append(fields.empty() ? "" : ", ").append(key).append("=").append(value);
    };
    if (ctx->combatant && !ctx->combatant->empty()) {
        field("combatant", *ctx->combatant);
    }
    if (ctx->turn) {
        field("turn", std::to_string(*ctx->turn));
    }
    for (const auto& [key, value] : ctx->extra) {
        field(key, value);
    }

    if (!fields.empty()) {
        line.append(" {").append(fields).append("}");
    }
    return line;
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    static constexpr std::pair<std::string_view, LogLevel> kAliases[] = {
        {"warn", LogLevel::Warning},
        {"fatal", LogLevel::Critical},
        {"none", LogLevel::Off},
    };
    for (const auto& [alias, level] : kAliases) {
        if (sameIgnoringCase(alias, name)) {
            return level;
        }
    }
    for (std::size_t i = 0; i < kBackendLevels.size(); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (sameIgnoringCase(logLevelName(level), name)) {
            return level;
        }
    }
    return std::nullopt;
}

// -- Impl --------------------------------------------------------------------

/// One routing channel per category: its threshold and registry name.
struct GameLogger::Impl {
    struct Channel {
        std::atomic<LogLevel> threshold{LogLevel::Info};
        std::string registryName;
    };

    std::array<Channel, kLogCategoryCount> channels;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            auto cat = static_cast<LogCategory>(i);
            channels[i].threshold.store(kInitialLevels[i], std::memory_order_relaxed);
            channels[i].registryName = "dqe." + std::string(logCategoryName(cat));
        }
    }

    [[nodiscard]] Channel* channel(LogCategory cat) {
        auto idx = static_cast<std::size_t>(cat);
        return idx < kLogCategoryCount ? &channels[idx] : nullptr;
    }

    [[nodiscard]] const Channel* channel(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        return idx < kLogCategoryCount ? &channels[idx] : nullptr;
    }

    /// The logger registered under the channel's name, else the default.
    [[nodiscard]] std::shared_ptr<kci::ILogger> sinkFor(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        const Channel* ch = channel(cat);
        if (ch == nullptr) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto named = registry.get_logger(ch->registryName);
        // The registry hands back its NullLogger for unknown names, and that
        // logger reports even `off` as disabled.
        if (named && named->is_enabled(kci::log_level::off)) {
            return named;
        }
        return registry.get_default_logger();
    }

    void emit(LogLevel level, LogCategory cat, const std::string& line) const {
        auto sink = sinkFor(cat);
        if (sink) {
            sink->log(toBackend(level), line);
        }
    }
};

// -- GameLogger --------------------------------------------------------------

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (isEnabled(level, cat)) {
        impl_->emit(level, cat, renderEntry(cat, msg, nullptr));
    }
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (isEnabled(level, cat)) {
        impl_->emit(level, cat, renderEntry(cat, msg, &ctx));
    }
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    if (auto* ch = impl_->channel(cat)) {
        ch->threshold.store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    const auto* ch = impl_->channel(cat);
    return ch != nullptr ? ch->threshold.load(std::memory_order_acquire) : LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    return level != LogLevel::Off &&
           static_cast<uint8_t>(level) >= static_cast<uint8_t>(getCategoryLevel(cat));
}

GameResult<void> GameLogger::flush() {
    auto sink = kci::GlobalLoggerRegistry::instance().get_default_logger();
    if (!sink) {
        return GameResult<void>::ok();
    }
    auto flushed = sink->flush();
    if (flushed.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "default log sink refused to flush"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger shared;
    return shared;
}

} // namespace dqe::foundation
