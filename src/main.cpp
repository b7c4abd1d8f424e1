/// @file src/main.cpp
/// @brief Thermo CLI entry point.
///
/// Usage:
///   thermo --posterior <csv_file>   Posterior credibility of every row
///   thermo --gap <csv_file>         Temperature-coverage score per material
///   thermo --rank <csv_file>        Posterior, then material ranking
///   thermo --help                   Print usage

#include "thermo/cli_options.hpp"
#include "thermo/data_loader.hpp"
#include "thermo/engine.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  thermo --posterior <csv_file> [--lambda X]\n"
        "  thermo --gap <csv_file> [--bins K] [--min T] [--max T]\n"
        "                          [--gamma1 G] [--gamma2 G]\n"
        "  thermo --rank <csv_file> [--lambda X] [--alpha A] [--beta B]\n"
        "  thermo --help\n"
        "\n"
        "Common options:\n"
        "  --deterministic   Sequential evaluation (bit-reproducible)\n"
        "  --verbose         Per-call diagnostics on stderr\n"
        "\n"
        "CSV format (header required, citations optional):\n"
        "  material,S,sigma,kappa,T,zt,zt_err,prior,citations\n"
    );
}

using thermo::cli::CliOptions;

std::optional<thermo::core::ObservationTable> load_table(const std::string& filepath) {
    auto table = thermo::core::DataLoader::load_csv(filepath);
    if (!table) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return std::nullopt;
    }
    if (table->empty()) {
        fmt::print(stderr, "Error: no valid rows loaded from '{}'\n", filepath);
        return std::nullopt;
    }
    return table;
}

/// Returns 0 on success, 1 on error.
int run_posterior(const CliOptions& opts) {
    auto table = load_table(opts.filepath);
    if (!table) return 1;

    const thermo::core::Engine engine(opts.engine);
    auto post = engine.posterior(table->batch(opts.penalty_weight));
    if (!post) {
        fmt::print(stderr, "Error: {}\n", post.error().to_string());
        return 1;
    }

    fmt::print("{:<16} {:>14} {:>16}\n", "material", "posterior", "log_posterior");
    for (std::size_t i = 0; i < table->size(); ++i) {
        fmt::print("{:<16} {:>14.6e} {:>16.6f}\n",
                   table->material_of(i),
                   post->probabilities[i],
                   post->log_posteriors[i]);
    }
    return 0;
}

/// Returns 0 on success, 1 on error.
int run_gap(const CliOptions& opts) {
    auto table = load_table(opts.filepath);
    if (!table) return 1;

    const thermo::core::Engine engine(opts.engine);
    auto scores = engine.information_gain(table->temperature(),
                                          table->material_bounds(),
                                          opts.histogram);
    if (!scores) {
        fmt::print(stderr, "Error: {}\n", scores.error().to_string());
        return 1;
    }

    fmt::print("{:<16} {:>6} {:>10} {:>10} {:>10}\n",
               "material", "n", "entropy", "kl", "score");
    const auto& names  = table->materials();
    const auto& bounds = table->material_bounds();
    for (std::size_t m = 0; m < names.size(); ++m) {
        const auto& s = (*scores)[m];
        fmt::print("{:<16} {:>6} {:>10.6f} {:>10.6f} {:>10.6f}\n",
                   names[m], bounds[m].size(),
                   s.entropy, s.kl_divergence, s.total_score);
    }
    return 0;
}

/// Returns 0 on success, 1 on error.
int run_rank(const CliOptions& opts) {
    auto table = load_table(opts.filepath);
    if (!table) return 1;

    const thermo::core::Engine engine(opts.engine);
    auto post = engine.posterior(table->batch(opts.penalty_weight));
    if (!post) {
        fmt::print(stderr, "Error: {}\n", post.error().to_string());
        return 1;
    }

    auto ranks = engine.material_rank(post->probabilities,
                                      table->zt_observed(),
                                      table->citations(),
                                      table->material_bounds(),
                                      opts.ranking);
    if (!ranks) {
        fmt::print(stderr, "Error: {}\n", ranks.error().to_string());
        return 1;
    }

    std::vector<std::size_t> order(ranks->size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return (*ranks)[a] > (*ranks)[b];
    });

    fmt::print("{:>4} {:<16} {:>14}\n", "#", "material", "rank");
    for (std::size_t pos = 0; pos < order.size(); ++pos) {
        const std::size_t m = order[pos];
        fmt::print("{:>4} {:<16} {:>14.6e}\n",
                   pos + 1, table->materials()[m], (*ranks)[m]);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--posterior" && mode != "--gap" && mode != "--rank") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a CSV file path\n", mode);
        print_usage();
        return 1;
    }

    CliOptions opts;
    opts.filepath = argv[2];
    const std::vector<std::string_view> flags(argv + 3, argv + argc);
    std::string error;
    if (!thermo::cli::parse_flags(flags, opts, error)) {
        fmt::print(stderr, "Error: {}\n", error);
        print_usage();
        return 1;
    }

    if (mode == "--posterior") return run_posterior(opts);
    if (mode == "--gap")       return run_gap(opts);
    return run_rank(opts);
}
