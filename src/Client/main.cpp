// =============================================================================
// BLOCKFORGE - ENTRY POINT
// Loads a building kit, runs one or more generations, prints the result
// =============================================================================

#include "Client/BuildKit.hpp"
#include "Client/GridPrinter.hpp"
#include "Client/PlacementLog.hpp"
#include "Server/BuildGrid.hpp"
#include "Server/GeneratorRegistry.hpp"
#include "Server/PlacementRules.hpp"
#include "Server/StructureGenerator.hpp"
#include "Shared/Logger.hpp"
#include "Shared/ThreadPool.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <future>
#include <optional>
#include <string>
#include <vector>

using namespace blockforge;
using namespace blockforge::server;
using namespace blockforge::client;

// =============================================================================
// COMMAND LINE
// =============================================================================
struct Options {
    std::string config_dir = "config";
    std::string generator;              // Empty: generator.type from settings
    std::optional<std::uint64_t> seed;  // Empty: generator.seed from settings
    std::size_t count = 1;
    std::size_t threads = 0;
    std::string log_file;
    std::string placements_file;        // Placement list of the first run
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

void print_usage(const char* program) {
    std::printf("Usage: %s [options]\n\n", program);
    std::printf("  --config DIR        Kit directory (default: config)\n");
    std::printf("  --generator NAME    Generator type (default: generator.type or frontier)\n");
    std::printf("  --seed N            Base seed; run i uses N + i\n");
    std::printf("  --count N           Number of structures to generate (default: 1)\n");
    std::printf("  --threads N         Worker threads for batches (default: hardware)\n");
    std::printf("  --log FILE          Write the full log to FILE\n");
    std::printf("  --placements FILE   Write the first run's placements to FILE\n");
    std::printf("  --verbose           Trace every placement decision\n");
    std::printf("  --quiet             Print summaries only, no grid dumps\n");
    std::printf("  --help              Show this message\n");
}

bool parse_unsigned(const char* text, std::uint64_t& out) {
    if (text == nullptr || *text == '\0' || *text == '-') return false;
    char* end = nullptr;
    out = std::strtoull(text, &end, 10);
    return end != nullptr && *end == '\0';
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = (i + 1 < argc) ? argv[i + 1] : nullptr;

        auto need_value = [&]() -> bool {
            if (value == nullptr) {
                std::fprintf(stderr, "Missing value for %s\n", arg);
                return false;
            }
            ++i;
            return true;
        };

        std::uint64_t number = 0;
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.help = true;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
        } else if (std::strcmp(arg, "--config") == 0) {
            if (!need_value()) return std::nullopt;
            opts.config_dir = value;
        } else if (std::strcmp(arg, "--generator") == 0) {
            if (!need_value()) return std::nullopt;
            opts.generator = value;
        } else if (std::strcmp(arg, "--log") == 0) {
            if (!need_value()) return std::nullopt;
            opts.log_file = value;
        } else if (std::strcmp(arg, "--placements") == 0) {
            if (!need_value()) return std::nullopt;
            opts.placements_file = value;
        } else if (std::strcmp(arg, "--seed") == 0) {
            if (!need_value()) return std::nullopt;
            if (!parse_unsigned(value, number)) {
                std::fprintf(stderr, "Invalid seed: %s\n", value);
                return std::nullopt;
            }
            opts.seed = number;
        } else if (std::strcmp(arg, "--count") == 0) {
            if (!need_value()) return std::nullopt;
            if (!parse_unsigned(value, number) || number == 0) {
                std::fprintf(stderr, "Invalid count: %s\n", value);
                return std::nullopt;
            }
            opts.count = static_cast<std::size_t>(number);
        } else if (std::strcmp(arg, "--threads") == 0) {
            if (!need_value()) return std::nullopt;
            if (!parse_unsigned(value, number)) {
                std::fprintf(stderr, "Invalid thread count: %s\n", value);
                return std::nullopt;
            }
            opts.threads = static_cast<std::size_t>(number);
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", arg);
            return std::nullopt;
        }
    }
    return opts;
}

// =============================================================================
// ONE RUN
// =============================================================================
struct RunResult {
    std::uint64_t seed = 0;
    GenerationSummary summary;
    BuildGrid grid;
    PlacementLog placements;
    double millis = 0.0;
};

RunResult run_once(const BuildKit& kit, const GeneratorRegistry& registry,
                   const std::string& generator_name, std::uint64_t seed) {
    RunResult result{seed, {}, BuildGrid(kit.grid), {}, 0.0};

    auto generator = registry.create(generator_name, kit.settings, seed);
    if (!generator) {
        result.summary.status = GenerationStatus::InvalidSetup;
        result.summary.problems.push_back("unknown generator '" + generator_name + "'");
        return result;
    }

    // Rules count placements, so every run gets its own set
    RuleSet rules;
    if (!kit.make_rules(rules)) {
        result.summary.status = GenerationStatus::InvalidSetup;
        result.summary.problems.push_back("rule configuration failed to load");
        return result;
    }

    GenerationContext ctx{kit.blocks, kit.sockets, kit.style, rules, nullptr, &result.placements};

    const auto start = std::chrono::steady_clock::now();
    result.summary = generator->generate(result.grid, ctx);
    const auto end = std::chrono::steady_clock::now();
    result.millis = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

void print_result(const RunResult& result, std::size_t index, const GridPrinter& printer, bool quiet) {
    const GenerationSummary& s = result.summary;
    std::printf("--- Run %zu (seed %llu) ---\n", index, static_cast<unsigned long long>(result.seed));
    std::printf("Status:      %.*s\n", static_cast<int>(status_name(s.status).size()), status_name(s.status).data());
    std::printf("Placed:      %zu\n", s.placed);
    std::printf("Iterations:  %zu\n", s.iterations);
    std::printf("Rejected:    %zu\n", s.rejected);
    std::printf("Unfillable:  %zu\n", s.invalid_cells.size());
    std::printf("Time:        %.2f ms\n", result.millis);
    for (const std::string& problem : s.problems) {
        std::printf("Problem:     %s\n", problem.c_str());
    }
    if (!quiet && s.ok()) {
        std::printf("\n%s", printer.render(result.grid, s.invalid_cells).c_str());
    }
    std::printf("\n");
}

// =============================================================================
// MAIN
// =============================================================================
int main(int argc, char* argv[]) {
    const std::optional<Options> parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage(argv[0]);
        return 2;
    }
    const Options& opts = *parsed;
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    Logger& logger = Logger::instance();
    if (opts.verbose) {
        logger.set_level(LogLevel::Trace);
    }
    if (!opts.log_file.empty() && !logger.open(opts.log_file)) {
        std::fprintf(stderr, "Failed to open log file: %s\n", opts.log_file.c_str());
        return 1;
    }

    std::printf("=== BLOCKFORGE ===\n");

    BuildKit kit;
    if (!kit.load(opts.config_dir)) {
        std::fprintf(stderr, "Failed to load kit from '%s'\n", opts.config_dir.c_str());
        return 1;
    }
    // [output] applies where the command line is silent
    if (!opts.verbose && kit.settings.has("output.verbosity")) {
        const std::string name = kit.settings.get_string("output.verbosity", "info");
        if (const auto level = log_level_from_name(name)) {
            logger.set_level(*level);
        } else {
            BLOCKFORGE_WARN("Main", "Unknown output.verbosity '", name, "', keeping the default");
        }
    }
    const std::string settings_log = kit.settings.get_string("output.log_file", "");
    if (opts.log_file.empty() && !settings_log.empty() && !logger.open(settings_log)) {
        std::fprintf(stderr, "Failed to open log file: %s\n", settings_log.c_str());
        return 1;
    }

    std::printf("Blocks:      %zu\n", kit.blocks.size());
    std::printf("Sockets:     %zu\n", kit.sockets.size());
    std::printf("Grid:        %d x %d x %d\n", kit.grid.dims.x, kit.grid.dims.y, kit.grid.dims.z);

    const GeneratorRegistry registry;
    const std::string generator_name = !opts.generator.empty()
        ? opts.generator
        : kit.settings.get_string("generator.type", "frontier");
    if (!registry.has_generator(generator_name)) {
        std::fprintf(stderr, "Unknown generator '%s'. Available: ", generator_name.c_str());
        for (const std::string& name : registry.list_generators()) {
            std::fprintf(stderr, "%s ", name.c_str());
        }
        std::fprintf(stderr, "\n");
        return 1;
    }
    std::printf("Generator:   %s\n", generator_name.c_str());

    std::uint64_t base_seed = 0;
    if (opts.seed) {
        base_seed = *opts.seed;
    } else if (!parse_unsigned(kit.settings.get_string("generator.seed", "0").c_str(), base_seed)) {
        BLOCKFORGE_WARN("Main", "generator.seed is not an unsigned integer, using 0");
        base_seed = 0;
    }
    std::printf("Runs:        %zu\n\n", opts.count);

    BLOCKFORGE_LOG_SEP();
    BLOCKFORGE_LOG("Main", "Generating ", opts.count, " structure(s) with '", generator_name, "'");

    std::vector<RunResult> results;
    results.reserve(opts.count);
    if (opts.count == 1) {
        results.push_back(run_once(kit, registry, generator_name, base_seed));
    } else {
        ThreadPool pool(opts.threads);
        std::vector<std::future<RunResult>> futures;
        futures.reserve(opts.count);
        for (std::size_t i = 0; i < opts.count; ++i) {
            const std::uint64_t seed = base_seed + i;
            futures.push_back(pool.submit([&kit, &registry, &generator_name, seed]() {
                return run_once(kit, registry, generator_name, seed);
            }));
        }
        for (auto& future : futures) {
            results.push_back(future.get());
        }
    }

    const GridPrinter printer(kit.blocks);
    std::size_t failures = 0;
    for (std::size_t i = 0; i < results.size(); ++i) {
        print_result(results[i], i, printer, opts.quiet);
        if (!results[i].summary.ok()) ++failures;
    }
    if (!opts.quiet) {
        std::printf("Legend:\n%s\n", printer.legend().c_str());
    }

    if (!opts.placements_file.empty() && !results.empty()) {
        if (!results.front().placements.write(opts.placements_file)) {
            std::fprintf(stderr, "Failed to write placements to %s\n", opts.placements_file.c_str());
            ++failures;
        }
    }

    std::printf("%zu of %zu run(s) produced a structure\n", results.size() - failures, results.size());
    BLOCKFORGE_LOG("Main", "Done, ", failures, " failure(s)");
    logger.close();
    return failures == 0 ? 0 : 1;
}
