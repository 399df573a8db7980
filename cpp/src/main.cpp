#include "spytext/api.hpp"
#include "spytext/batch.hpp"
#include "spytext/config.hpp"
#include "spytext/logging.hpp"
#include "spytext/report.hpp"
#include "spytext/sanitizer.hpp"

#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* kVersion = "0.1.0";

spytext::BatchScanner* g_scanner = nullptr;

void handle_signal(int) {
    if (g_scanner) {
        g_scanner->stop();
    }
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " scan <spans.json>... [--config <path>] [--json] [--verbose]\n"
              << "       " << argv0
              << " clean <spans.json> [--config <path>] [--strategy strip|flag|preserve] [--output <path>]\n"
              << "       " << argv0 << " --help | --version\n"
              << "Exit codes: 1 safe, 2 suspicious (hidden text found), 3 error\n";
}

struct Options {
    std::string command;
    std::vector<std::string> inputs;
    std::string config_path;
    bool json = false;
    bool verbose = false;
    std::optional<std::string> strategy;
    std::optional<std::string> output_path;
};

bool parse_options(int argc, char** argv, Options& options) {
    if (argc < 2) {
        return false;
    }
    options.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto take_value = [&](std::string& target) {
            if (i + 1 >= argc) {
                return false;
            }
            target = argv[++i];
            return true;
        };
        if (arg == "--config") {
            if (!take_value(options.config_path)) {
                return false;
            }
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--strategy") {
            std::string value;
            if (!take_value(value)) {
                return false;
            }
            options.strategy = value;
        } else if (arg == "--output" || arg == "-o") {
            std::string value;
            if (!take_value(value)) {
                return false;
            }
            options.output_path = value;
        } else if (!arg.empty() && arg.front() == '-') {
            return false;
        } else {
            options.inputs.push_back(arg);
        }
    }
    return !options.inputs.empty();
}

spytext::SpyTextSettings load_settings(const Options& options) {
    auto settings = options.config_path.empty() ? spytext::SpyTextSettings{}
                                                : spytext::SpyTextSettings::from_toml(options.config_path);
    return settings;
}

int run_scan(const Options& options) {
    const auto settings = load_settings(options);
    settings.validate();
    spytext::configure_logging(settings.logging);
    spytext::BatchScanner scanner(settings);
    g_scanner = &scanner;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const auto outcomes = scanner.scan(options.inputs);
    g_scanner = nullptr;

    if (options.json) {
        std::vector<std::string> rendered;
        for (const auto& outcome : outcomes) {
            if (outcome.result.has_value()) {
                rendered.push_back(spytext::render_json(*outcome.result, settings.report));
            } else {
                rendered.push_back(spytext::render_error_json(outcome.path, outcome.error.value_or("unknown error")));
            }
        }
        if (rendered.size() == 1) {
            std::cout << rendered.front() << "\n";
        } else {
            std::cout << "[\n";
            for (std::size_t i = 0; i < rendered.size(); ++i) {
                std::cout << rendered[i] << (i + 1 < rendered.size() ? ",\n" : "\n");
            }
            std::cout << "]\n";
        }
    } else {
        for (const auto& outcome : outcomes) {
            if (outcome.result.has_value()) {
                std::cout << spytext::render_text(*outcome.result, options.verbose);
            } else {
                std::cout << "Scanning: " << outcome.path << "\n"
                          << "  Error: " << outcome.error.value_or("unknown error") << "\n";
            }
        }
    }
    return spytext::exit_code(spytext::worst_status(outcomes));
}

int run_clean(const Options& options) {
    if (options.inputs.size() != 1) {
        throw std::runtime_error("clean takes exactly one span document");
    }
    const auto settings = load_settings(options);
    const auto analyzer = spytext::build_analyzer(settings);
    const auto document = spytext::load_span_document(options.inputs.front());
    const auto result = analyzer.analyze(document);

    std::optional<spytext::SanitizationStrategy> strategy;
    if (options.strategy.has_value()) {
        strategy = spytext::parse_strategy(*options.strategy);
    }
    spytext::TextSanitizer sanitizer(settings.sanitization);
    const auto report = sanitizer.sanitize(result.verdicts, strategy, result.assessment.level);

    std::cerr << "Cleaning: " << document.name << "\n"
              << "  Risk: " << spytext::risk_level_name(result.assessment.level) << "\n"
              << "  Strategy: " << spytext::strategy_name(report.strategy) << "\n"
              << "  Original: " << report.original_span_count << " spans\n"
              << "  Removed: " << report.removed_count << " spans\n";
    if (report.flagged_count > 0) {
        std::cerr << "  Flagged: " << report.flagged_count << " spans\n";
    }

    if (options.output_path.has_value()) {
        std::ofstream output(*options.output_path);
        if (!output) {
            throw std::runtime_error("unable to write output file: " + *options.output_path);
        }
        output << report.safe_text;
        std::cerr << "  Output: " << *options.output_path << "\n";
    } else {
        std::cout << report.safe_text << "\n";
    }
    return spytext::exit_code(spytext::DocumentStatus::kSafe);
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2) {
        const std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (first == "--version") {
            std::cout << "spytext " << kVersion << "\n";
            return 0;
        }
    }

    Options options;
    if (!parse_options(argc, argv, options)) {
        print_usage(argv[0]);
        return spytext::exit_code(spytext::DocumentStatus::kError);
    }

    try {
        if (options.command == "scan") {
            return run_scan(options);
        }
        if (options.command == "clean") {
            return run_clean(options);
        }
        print_usage(argv[0]);
    } catch (const std::exception& exc) {
        std::cerr << "spytext error: " << exc.what() << "\n";
    }
    return spytext::exit_code(spytext::DocumentStatus::kError);
}
