#include "core/LoggingChannels.h"
#include "core/SeedPattern.h"
#include "core/Universe.h"
#include "core/UniverseConfig.h"
#include "core/UniverseDiagramGenerator.h"

#include <args.hxx>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>

using namespace Convida;

static volatile std::sig_atomic_t g_shouldExit = 0;

void signalHandler(int)
{
    g_shouldExit = 1;
}

static void printFrame(const Universe& universe, bool bordered)
{
    if (bordered) {
        std::cout << UniverseDiagramGenerator::generateBorderedDiagram(universe);
    }
    else {
        std::cout << universe.render();
    }
    std::cout << std::endl;
}

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Convida - Conway's Game of Life on a toroidal grid",
        "Seeds a universe, then prints one text frame per generation.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<std::string> configPath(
        parser, "config", "Path to universe config JSON", { 'c', "config" });
    args::ValueFlag<uint32_t> widthArg(parser, "width", "Grid columns", { 'W', "width" });
    args::ValueFlag<uint32_t> heightArg(parser, "height", "Grid rows", { 'H', "height" });
    args::ValueFlag<std::string> patternArg(
        parser,
        "pattern",
        "Seed generator (" + getSeedPatternNames() + ")",
        { 'p', "pattern" });
    args::ValueFlag<uint32_t> stepsArg(
        parser, "steps", "Number of generations to run", { 's', "steps" });
    args::ValueFlag<uint32_t> seedArg(
        parser, "seed", "Random seed for reproducible runs", { "seed" });
    args::ValueFlagList<std::string> gliderArgs(
        parser, "row,col", "Stamp a glider (repeatable)", { "glider" });
    args::ValueFlagList<std::string> pulsarArgs(
        parser, "row,col", "Stamp a pulsar (repeatable)", { "pulsar" });
    args::ValueFlag<uint32_t> delayArg(
        parser, "ms", "Delay between frames in milliseconds", { 'd', "delay" });
    args::Flag border(parser, "border", "Draw a frame around the grid", { "border" });
    args::Flag finalOnly(
        parser, "final-only", "Print only the last generation", { "final-only" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., tick:trace,pattern:debug,*:off)",
        { 'C', "channels" });
    args::Flag printStats(
        parser, "print-stats", "Print tick timer statistics on exit", { "print-stats" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    LoggingChannels::initializeFromConfig(args::get(logConfig));
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        spdlog::info("Applied channel overrides: {}", args::get(logChannels));
    }

    auto logger = LoggingChannels::cli();

    // Config file first, command line flags override it.
    UniverseConfig config = getDefaultUniverseConfig();
    if (configPath) {
        auto loaded = loadUniverseConfig(args::get(configPath));
        if (loaded.isError()) {
            std::cerr << "Error: " << loaded.errorValue().message << std::endl;
            return 1;
        }
        config = loaded.value();
    }

    if (widthArg) config.width = args::get(widthArg);
    if (heightArg) config.height = args::get(heightArg);
    if (stepsArg) config.steps = args::get(stepsArg);
    if (delayArg) config.frame_delay_ms = args::get(delayArg);
    if (seedArg) config.random_seed = args::get(seedArg);

    if (patternArg) {
        auto pattern = parseSeedPattern(args::get(patternArg));
        if (pattern.isError()) {
            std::cerr << "Error: " << pattern.errorValue().message << std::endl;
            return 1;
        }
        config.seed_pattern = pattern.value();
    }

    for (const auto& text : args::get(gliderArgs)) {
        auto anchor = parsePatternAnchor(text);
        if (anchor.isError()) {
            std::cerr << "Error: --glider: " << anchor.errorValue().message << std::endl;
            return 1;
        }
        config.gliders.push_back(anchor.value());
    }

    for (const auto& text : args::get(pulsarArgs)) {
        auto anchor = parsePatternAnchor(text);
        if (anchor.isError()) {
            std::cerr << "Error: --pulsar: " << anchor.errorValue().message << std::endl;
            return 1;
        }
        config.pulsars.push_back(anchor.value());
    }

    auto validated = validateUniverseConfig(config);
    if (validated.isError()) {
        std::cerr << "Error: " << validated.errorValue().message << std::endl;
        return 1;
    }

    logger->debug("Effective config: {}", nlohmann::json(config).dump());

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::unique_ptr<Universe> universe;
    try {
        universe = std::make_unique<Universe>(createUniverse(config));
    }
    catch (const std::out_of_range& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const bool bordered = args::get(border);

    logger->info(
        "Running {} generations on a {}x{} universe", config.steps, config.width, config.height);

    if (!finalOnly) {
        printFrame(*universe, bordered);
    }

    for (uint32_t step = 0; step < config.steps && !g_shouldExit; ++step) {
        if (!finalOnly && config.frame_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config.frame_delay_ms));
        }

        universe->tick();

        if (!finalOnly) {
            printFrame(*universe, bordered);
        }
    }

    if (finalOnly) {
        printFrame(*universe, bordered);
    }

    logger->info(
        "Stopped at generation {} with {} live cells",
        universe->getGeneration(),
        universe->countAlive());

    if (printStats) {
        std::cout << "\n=== Tick Timer Statistics ===" << std::endl;
        std::cout << universe->getTimers().exportAllTimersAsJson().dump(2) << std::endl;
    }

    return 0;
}
