#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <profitguardian/core/config/loader.hpp>
#include <profitguardian/core/model/errors.hpp>
#include <profitguardian/core/platform/feed_platform.hpp>
#include <profitguardian/core/scheduler/guardian_context.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("ProfitGuardian starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void applyLogLevel(const AppConfig::AppConfiguration& config) {
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::info("Log level: {}", config.logging.level);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/guardian.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Destruction order: context before the platform it calls into
    std::unique_ptr<ProfitGuardian::FeedAdsPlatform> platform;
    std::unique_ptr<ProfitGuardian::GuardianContext> context;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;
    c.platform = std::make_unique<ProfitGuardian::FeedAdsPlatform>(
        config.platform.feed_path, config.platform.action_log_path);
    c.context = std::make_unique<ProfitGuardian::GuardianContext>(config, *c.platform);
    c.context->init();
    return c;
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    if (c.context) {
        c.context->shutdown();
        auto stats = c.context->getStats();
        spdlog::info("Ticks: {} committed, {} skipped (overlap), {} skipped (disabled), {} aborted",
                     stats.ticks_committed, stats.ticks_skipped_overlap,
                     stats.ticks_skipped_disabled, stats.ticks_aborted);
        spdlog::info("Actions: {} applied, {} failed", stats.actions_applied, stats.actions_failed);
    }

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        applyLogLevel(config);
        spdlog::info("Configuration loaded successfully ({} v{}, {} entities)",
                     config.app_name, config.version, config.entities.size());

        auto components = initializeComponents(config);
        components.context->start();

        spdlog::info("ProfitGuardian running. Press Ctrl+C to shutdown.");

        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        spdlog::info("Shutdown signal received");

        stopComponents(components);

    } catch (const ProfitGuardian::ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("ProfitGuardian terminated gracefully");
    return EXIT_SUCCESS;
}
