#include "config.hpp"
#include "organizer.hpp"
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    cxxopts::Options options("entropy_sorter",
        "Routes new files in a watched folder into subfolders by rule or suggestion");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>()->default_value("rules.yaml"))
        ("w,watch", "Watched root (overrides config)", cxxopts::value<std::string>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("entropy_sorter");

    // Load config
    sorter::config cfg;
    try {
        cfg = sorter::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // CLI overrides
    if (result.count("watch"))   cfg.watch_root = result["watch"].as<std::string>();
    if (result.count("verbose")) cfg.log_level = "debug";

    // Set log level
    if (cfg.log_level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (cfg.log_level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (cfg.log_level == "error") spdlog::set_level(spdlog::level::err);
    else                               spdlog::set_level(spdlog::level::info);

    console->info("entropy_sorter starting");
    console->info("  watched root: {}", cfg.watch_root);
    console->info("  rules: {}", cfg.rules.size());
    console->info("  suggestions: {} (model={})", cfg.suggestions.enabled ? "on" : "off", cfg.suggestions.model);
    console->info("  preserve_structure: {}", cfg.preserve_structure);

    // Single-threaded io_context: inotify reads, dispatch, stats timer
    asio::io_context ioc(1);

    std::unique_ptr<sorter::organizer> engine;
    try {
        engine = std::make_unique<sorter::organizer>(ioc, cfg, console);
    } catch (const std::exception& e) {
        console->error("Failed to start: {}", e.what());
        return 1;
    }

    // Graceful shutdown
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        engine->stop();
        ioc.stop();
    });

    engine->start();
    ioc.run();

    engine.reset();
    console->info("entropy_sorter stopped");
    return 0;
}
