// apps/live_signals.cpp
// Live HYPE direction signals: one prediction row per cadence tick

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include "signal_ngin/core/config_loader.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/state_manager.hpp"
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/data/hyperliquid_snapshot_source.hpp"
#include "signal_ngin/live/pipeline_builder.hpp"

using namespace signal_ngin;

namespace {

std::atomic<TickScheduler*> g_scheduler{nullptr};

extern "C" void handle_stop_signal(int) {
    TickScheduler* scheduler = g_scheduler.load();
    if (scheduler) {
        scheduler->request_stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config-dir DIR] [--variant NAME]" << std::endl;
    std::cerr << "Example: " << program << " --config-dir ./config --variant hype_30s"
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_dir = "./config";
    std::string variant;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config-dir" && i + 1 < argc) {
            config_dir = argv[++i];
        } else if (arg == "--variant" && i + 1 < argc) {
            variant = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Invalid argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        // Logging comes up on console first so that config errors are visible
        auto& logger = Logger::instance();
        LoggerConfig boot_logging;
        boot_logging.destination = LogDestination::CONSOLE;
        logger.initialize(boot_logging);

        auto config_result = ConfigLoader::load(config_dir, variant);
        if (config_result.is_error()) {
            FATAL("Configuration error: " << config_result.error()->to_string());
            return 1;
        }
        AppConfig config = config_result.value();

        logger.initialize(config.logging);
        Logger::register_component("main");
        INFO("signal_ngin_live starting with variant '"
             << (variant.empty() ? "defaults" : variant) << "' from " << config_dir);

        auto clock = std::make_shared<SystemClock>();
        Timestamp run_start = clock->now();
        std::string run_id = (variant.empty() ? std::string("defaults") : variant) + "_" +
                             core::format_time(run_start, "%Y%m%d_%H%M%S");

        auto recorder = Recorder::open(config.recorder, make_record_schema(config), run_start);
        if (recorder.is_error()) {
            FATAL("Cannot open record files: " << recorder.error()->to_string());
            return 1;
        }

        // Keep the resolved configuration beside the record it produced
        auto config_path = std::filesystem::path(config.recorder.output_directory) /
                           (config.recorder.file_prefix + "_" +
                            core::format_time(run_start, "%Y%m%d_%H%M%S") + ".config.json");
        auto saved = config.save_to_file(config_path.string());
        if (saved.is_error()) {
            WARN("Could not save resolved config: " << saved.error()->to_string());
        }

        auto source = std::make_shared<HyperliquidSnapshotSource>(config.market, clock);
        auto pipeline = build_pipeline(config, source, recorder.take());
        if (pipeline.is_error()) {
            FATAL("Cannot build pipeline: " << pipeline.error()->to_string());
            return 1;
        }

        TickScheduler scheduler(config.scheduler, config.horizons_s, clock, pipeline.take());
        g_scheduler.store(&scheduler);
        std::signal(SIGINT, handle_stop_signal);
        std::signal(SIGTERM, handle_stop_signal);

        auto started = scheduler.start(run_id, config.to_json());
        if (started.is_error()) {
            ERROR("Session start failed, entering retry: " << started.error()->to_string());
        }

        auto result = scheduler.run();
        g_scheduler.store(nullptr);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);

        if (result.is_error()) {
            FATAL("Stopped on unrecoverable error: " << result.error()->to_string());
            return 1;
        }

        INFO("signal_ngin_live stopped cleanly after "
             << scheduler.recorder().rows_written() << " row(s), "
             << scheduler.skipped_ticks() << " skipped tick(s)");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
