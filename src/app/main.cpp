/// @file main.cpp
/// @brief dungeon_quest entry point.
///
/// Loads configuration, installs a stderr log sink, builds the content
/// catalog and runs the console adventure on stdin/stdout.

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include "dqe/app/app_support.hpp"
#include "dqe/app/console_frontend.hpp"
#include "dqe/foundation/config_manager.hpp"
#include "dqe/foundation/game_logger.hpp"
#include "dqe/version.hpp"

namespace {

namespace kci = kcenon::common::interfaces;

/// Writes log lines to stderr so they never interleave with the game
/// screen on stdout.
class StderrLogger : public kci::ILogger {
public:
    kcenon::common::VoidResult log(kci::log_level level, const std::string& message) override {
        if (is_enabled(level)) {
            std::lock_guard lock(mutex_);
            std::cerr << message << '\n';
        }
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(kci::log_level level, std::string_view message,
                                   const kci::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kci::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(kci::log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(kci::log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kci::log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        std::lock_guard lock(mutex_);
        std::cerr.flush();
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

private:
    std::mutex mutex_;
    std::atomic<kci::log_level> minLevel_{kci::log_level::trace};
};

void flushLogs(dqe::foundation::GameLogger& logger) {
    auto result = logger.flush();
    if (!result) {
        std::cerr << result.error().describe() << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    kci::GlobalLoggerRegistry::instance().set_default_logger(std::make_shared<StderrLogger>());
    auto& logger = dqe::foundation::GameLogger::instance();

    dqe::foundation::ConfigManager config;
    auto loadResult = dqe::app::loadConfig(config, dqe::app::parseConfigArg(argc, argv));
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto loggingResult = dqe::app::applyLoggingConfig(config, logger);
    if (!loggingResult) {
        std::cerr << "Invalid logging config: " << loggingResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto settings = dqe::app::buildEngineSettings(config);
    if (!settings) {
        std::cerr << "Failed to prepare game: " << settings.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto rng = dqe::app::makeRandomSource(config);
    if (!rng) {
        std::cerr << "Invalid RNG seed: " << rng.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    DQE_LOG_INFO(dqe::foundation::LogCategory::Core,
                 std::string("dungeon_quest ") + DQE_VERSION_STRING + " starting");
    std::cout << "Loading Dungeon Quest...\n";

    dqe::app::ConsoleAdventure adventure(settings.value(), *rng.value(), std::cin, std::cout);
    auto outcome = adventure.Run();
    if (!outcome) {
        std::cerr << "Adventure aborted: " << outcome.error().describe() << "\n";
        flushLogs(logger);
        return EXIT_FAILURE;
    }

    std::cout << "\nThanks for playing!\n";
    flushLogs(logger);
    return EXIT_SUCCESS;
}
