#include <catch2/catch_session.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <resumable/util/logger.hpp>
#include <cstdlib>
#include <string>

// Global test event listener to initialize logging
class LoggingInitializer : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        static bool initialized = false;
        if (initialized) return;

        // Enable the library's logging
        resumable::logging::enable();

        // Set log level based on environment variable or default to warn
        const char* log_level_env = std::getenv("RESUMABLE_LOG_LEVEL");
        if (log_level_env) {
            std::string level_str(log_level_env);
            if (level_str == "trace") {
                resumable::logging::set_log_level(spdlog::level::trace);
            } else if (level_str == "debug") {
                resumable::logging::set_log_level(spdlog::level::debug);
            } else if (level_str == "info") {
                resumable::logging::set_log_level(spdlog::level::info);
            } else if (level_str == "warn") {
                resumable::logging::set_log_level(spdlog::level::warn);
            } else if (level_str == "error") {
                resumable::logging::set_log_level(spdlog::level::err);
            } else if (level_str == "critical") {
                resumable::logging::set_log_level(spdlog::level::critical);
            } else if (level_str == "off") {
                resumable::logging::set_log_level(spdlog::level::off);
            }
        } else {
            // Default to warn level for tests
            resumable::logging::set_log_level(spdlog::level::warn);
        }

        initialized = true;

        LOG_INFO("Test logging initialized. Level: {}", log_level_env ? log_level_env : "warn");
    }
};

// Register the listener
CATCH_REGISTER_LISTENER(LoggingInitializer)

// Custom main
int main(int argc, char* argv[]) {
    return Catch::Session().run(argc, argv);
}
