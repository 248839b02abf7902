/**
 * @file main.cpp
 * @brief cluster_scaler daemon entry point.
 *
 * Wires the modules into one refresh loop:
 *   Config → Logger → ResourceLimiter → CloudProvider → refresh / observe per tick → cleanup
 */

#include "cloudprovider/builder.hpp"
#include "cloudprovider/resource_limiter.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace cluster_scaler;

namespace {

constexpr std::string_view kComponent = "main";

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string inventory_path;
    std::string log_level;
    bool once = false;
    bool help = false;
};

void print_usage() {
    std::cout << "Usage: cluster_scaler [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --inventory <path>   Rancher inventory file, overrides rancher.inventory_path\n"
              << "  --log-level <level>  debug | info | warn | error\n"
              << "  --once               Run a single refresh tick, then exit\n"
              << "  --help, -h           Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--inventory" && i + 1 < argc) {
            args.inventory_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }
    return args;
}

/**
 * @brief Log the groups and sizes of the current generation.
 */
void report_node_groups(const ICloudProvider& provider, Logger& logger) {
    auto groups = provider.node_groups();
    logger.info(kComponent, "generation " + std::to_string(provider.generation()) + ": "
                + std::to_string(groups.size()) + " node groups");

    for (const auto& group : groups) {
        auto target = group->target_size();
        auto nodes = group->nodes();
        if (!target || !nodes) {
            const auto& err = !target ? target.error() : nodes.error();
            logger.warn(kComponent, "node group " + group->id() + ": " + err.message);
            continue;
        }
        logger.info(kComponent, "node group " + group->debug() + " target "
                    + std::to_string(*target) + ", registered " + std::to_string(nodes->size()));
    }
}

/**
 * @brief Sleep for @p interval, waking early on shutdown.
 */
void wait_for_next_tick(std::chrono::milliseconds interval) {
    auto deadline = std::chrono::steady_clock::now() + interval;
    while (!g_shutdown_requested && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.help) {
        print_usage();
        return 0;
    }

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.inventory_path.empty()) config.autoscaler.rancher.inventory_path = args.inventory_path;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << level.error().message << ", using info" << std::endl;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "cluster_scaler",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), level.value_or(LogLevel::Info));
    logger.info(kComponent, "cluster_scaler starting, provider " + config.autoscaler.cloud_provider);

    // ── Build the cloud provider ─────────────
    auto limiter = ResourceLimiter::from_config(config.limits);
    logger.info(kComponent, "resource limits " + limiter->to_string());

    auto provider_result = build_cloud_provider(config.autoscaler, config.discovery, limiter, logger);
    if (!provider_result) {
        logger.error(kComponent, "cannot start: " + provider_result.error().message);
        logger.flush();
        return EXIT_FAILURE;
    }
    auto provider = std::move(*provider_result);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Main Refresh Loop ────────────────────
    const std::chrono::milliseconds interval{config.autoscaler.scan_interval_ms};
    uint64_t max_ticks = args.once ? 1 : config.autoscaler.max_ticks;
    uint64_t tick = 0;
    uint64_t consecutive_failures = 0;

    while (!g_shutdown_requested) {
        auto status = provider->refresh();
        if (status) {
            consecutive_failures = 0;
        } else {
            ++consecutive_failures;
            logger.warn(kComponent, "refresh failed (" + std::to_string(consecutive_failures)
                        + " in a row), using generation " + std::to_string(provider->generation())
                        + ": " + status.error().message);
        }

        report_node_groups(*provider, logger);

        ++tick;
        if (max_ticks != 0 && tick >= max_ticks) break;
        wait_for_next_tick(interval);
    }

    // ── Graceful Shutdown ────────────────────
    logger.info(kComponent, "shutting down after " + std::to_string(tick) + " ticks");
    auto cleanup = provider->cleanup();
    if (!cleanup) {
        logger.error(kComponent, "cleanup failed: " + cleanup.error().message);
    }
    provider.reset();

    logger.info(kComponent, "cluster_scaler stopped");
    logger.flush();
    return cleanup ? EXIT_SUCCESS : EXIT_FAILURE;
}
