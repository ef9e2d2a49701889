/// @file src/main.cpp
/// @brief drawstat CLI entry point.
///
/// Usage:
///   drawstat --analyze <csv_file> [--position N] [--top K]
///   drawstat --validate <csv_file> [--folds K]
///   drawstat --help

#include "drawstat/data_loader.hpp"
#include "drawstat/engine.hpp"
#include "drawstat/errors.hpp"
#include "drawstat/log.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <charconv>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace {

using drawstat::core::DataLoader;
using drawstat::core::Engine;

struct Options {
    std::string                mode;
    std::string                csv;
    std::optional<std::size_t> position;
    std::size_t                top     = 5;
    std::size_t                folds   = 5;
    drawstat::Value            min     = 0;
    drawstat::Value            max     = 9;
    bool                       verbose = false;
};

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  drawstat --analyze <csv_file> [--position N] [--top K]\n"
        "  drawstat --validate <csv_file> [--folds K]\n"
        "  drawstat --help\n"
        "\n"
        "Options:\n"
        "  --min V / --max V   Value range of every position (default 0-9)\n"
        "  --verbose           Log progress to stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  date,p1,p2,...,pN\n"
    );
}

template <typename T>
std::optional<T> parse_number(std::string_view s) {
    T out{};
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, out);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return out;
}

/// Parse argv into Options. Prints the problem and returns nullopt on error.
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        const auto next = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };
        const auto number = [&]<typename T>(T& target) {
            const auto v = next();
            if (!v) return false;
            const auto n = parse_number<T>(*v);
            if (!n) {
                fmt::print(stderr, "Error: {} expects a number, got '{}'\n", arg, *v);
                return false;
            }
            target = *n;
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            opt.mode = "help";
        } else if (arg == "--analyze" || arg == "--validate") {
            const auto v = next();
            if (!v) return std::nullopt;
            opt.mode = std::string(arg.substr(2));
            opt.csv  = std::string(*v);
        } else if (arg == "--position") {
            std::size_t p = 0;
            if (!number(p)) return std::nullopt;
            opt.position = p;
        } else if (arg == "--top") {
            if (!number(opt.top)) return std::nullopt;
        } else if (arg == "--folds") {
            if (!number(opt.folds)) return std::nullopt;
        } else if (arg == "--min") {
            if (!number(opt.min)) return std::nullopt;
        } else if (arg == "--max") {
            if (!number(opt.max)) return std::nullopt;
        } else if (arg == "--verbose" || arg == "-v") {
            opt.verbose = true;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        }
    }
    if (opt.min > opt.max) {
        fmt::print(stderr, "Error: --min {} exceeds --max {}\n", opt.min, opt.max);
        return std::nullopt;
    }
    return opt;
}

std::optional<drawstat::core::DrawTable> load(const Options& opt) {
    auto table = DataLoader::load_csv(opt.csv, drawstat::ValueRange{opt.min, opt.max});
    if (!table) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opt.csv);
        return std::nullopt;
    }
    if (table->layout.positions() == 0 || table->draws.empty()) {
        fmt::print(stderr, "Error: no valid draws loaded from '{}'\n", opt.csv);
        return std::nullopt;
    }
    fmt::print("Loaded {} draws ({} positions, {} rows skipped) from '{}'\n",
               table->draws.size(), table->layout.positions(), table->skipped_rows, opt.csv);
    return table;
}

// ─── --analyze ────────────────────────────────────────────────────────────────

void print_position(const Engine& engine, std::size_t p, std::size_t top) {
    fmt::print("\nPosition {}\n", p + 1);

    if (const auto s = engine.position_summary(p)) {
        fmt::print("  draws {}  unique {}  most {}  least {}\n",
                   s->total_draws, s->unique_values, s->most_frequent_value,
                   s->least_frequent_value);
        fmt::print("  skip mean {:.2f}  median {:.1f}  mode {:.0f}  sd {:.2f}  range [{}, {}]\n",
                   s->mean_skip, s->median_skip, s->mode_skip, s->std_dev,
                   s->min_skip, s->max_skip);
    }

    fmt::print("  {:>5} {:>6} {:>5} {:>7} {:>5}  {}\n",
               "value", "count", "gap", "avg", "max", "flags");
    for (const auto& [value, st] : engine.position_stats(p)) {
        std::string flags;
        if (st.is_hot)   flags += "hot ";
        if (st.is_cold)  flags += "cold ";
        if (st.is_due()) flags += "due ";
        flags += drawstat::to_string(st.trend);
        fmt::print("  {:>5} {:>6} {:>5} {:>7.2f} {:>5}  {}\n",
                   value, st.total_appearances, st.current_gap, st.average_gap,
                   st.max_gap, flags);
    }

    const auto snap = engine.snapshot();
    const auto last = snap->value_at(snap->size() - 1, p);
    fmt::print("  next after {}:", last);
    for (const auto& t : engine.transitions(p, last, top)) {
        fmt::print("  {} ({:.3f})", t.to_value, t.adjusted_probability);
    }
    fmt::print("\n");
}

int run_analyze(const Options& opt) {
    const auto table = load(opt);
    if (!table) return 1;

    const drawstat::InMemorySequenceStore store(table->layout, table->draws);
    const Engine engine(store);
    const std::size_t n = table->layout.positions();

    if (opt.position) {
        if (*opt.position == 0 || *opt.position > n) {
            fmt::print(stderr, "Error: --position must be in 1..{}\n", n);
            return 1;
        }
        print_position(engine, *opt.position - 1, opt.top);
    } else {
        for (std::size_t p = 0; p < n; ++p) print_position(engine, p, opt.top);
    }

    fmt::print("\nCorrelations\n");
    for (const auto& c : engine.correlations()) {
        fmt::print("  {}-{}  r {:+.3f}  {}  significance {:.3f}\n",
                   c.position_a + 1, c.position_b + 1, c.coefficient,
                   drawstat::to_string(c.strength), c.significance);
    }

    fmt::print("\nTop combinations\n");
    const auto top = engine.top_combinations(opt.top);
    if (top.empty()) {
        fmt::print("  (need at least {} draws)\n",
                   engine.config().scoring.min_draws_for_combinations);
    }
    for (const auto& c : top) {
        fmt::print("  {}  total {:.3f}  confidence {:.3f}\n",
                   fmt::join(c.combination, "-"), c.total, c.confidence);
    }
    return 0;
}

// ─── --validate ───────────────────────────────────────────────────────────────

int run_validate(const Options& opt) {
    const auto table = load(opt);
    if (!table) return 1;

    const drawstat::InMemorySequenceStore store(table->layout, table->draws);
    const Engine engine(store);

    const auto report = engine.cross_validate(
        Engine::due_score_predictor(engine.config().scoring, engine.config().analyzer),
        opt.folds, nullptr,
        [](std::size_t done, std::size_t total) {
            drawstat::log::info("cli", "fold {}/{} done", done, total);
        });
    const auto significance = engine.significance_tests(report);

    fmt::print("\n{}", drawstat::validation::render_report(report, significance));
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const auto opt = parse_args(argc, argv);
    if (!opt) {
        print_usage();
        return 1;
    }
    if (opt->verbose) drawstat::log::set_level(drawstat::log::Level::Debug);

    try {
        if (opt->mode == "help") {
            print_usage();
            return 0;
        }
        if (opt->mode == "analyze") return run_analyze(*opt);
        if (opt->mode == "validate") return run_validate(*opt);
    } catch (const drawstat::Error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Unexpected error: {}\n", e.what());
        return 1;
    }

    fmt::print(stderr, "Error: one of --analyze or --validate is required\n");
    print_usage();
    return 1;
}
