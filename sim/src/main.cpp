#include "avrdeck/common/PluginConfig.h"
#include "avrdeck/sim/ScenarioRunner.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

struct SimOptions {
    std::filesystem::path scenarioPath;
    std::filesystem::path configPath;
    std::string logLevel;
};

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"avrdeck scenario simulator"};
    SimOptions opts;

    app.add_option("--scenario", opts.scenarioPath, "Scenario JSON file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("--config", opts.configPath, "Plugin config JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("--log-level", opts.logLevel, "Override log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember(avrdeck::common::logLevelNames()));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        avrdeck::common::PluginConfig config;
        if (!opts.configPath.empty()) {
            config = avrdeck::common::loadPluginConfig(opts.configPath);
        }
        if (!opts.logLevel.empty()) {
            config.logLevel = opts.logLevel;
        }
        spdlog::set_level(avrdeck::common::parseLogLevel(config.logLevel));
        spdlog::info("Status scope: {}, idle timeout: {}",
                     avrdeck::common::toString(config.statusScope),
                     config.idleConnectionTimeout
                         ? std::to_string(config.idleConnectionTimeout->count()) + "ms"
                         : std::string("keep warm"));

        avrdeck::sim::ScenarioRunner runner(config);
        runner.load(avrdeck::sim::ScenarioRunner::readScenarioFile(opts.scenarioPath));
        const auto report = runner.run();
        std::cout << std::setw(2) << report << "\n";
    } catch (const std::exception& ex) {
        spdlog::error("Scenario failed: {}", ex.what());
        return 1;
    }

    return 0;
}
