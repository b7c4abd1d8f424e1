/// @file src/cli/cli_options.cpp
/// @brief Flag parsing for the `thermo` command-line tool.

#include "thermo/cli_options.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>

namespace thermo::cli {

// ─── Value parsers ────────────────────────────────────────────────────────────

std::optional<double> parse_real(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::size_t> parse_count(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// ─── parse_flags ──────────────────────────────────────────────────────────────

bool parse_flags(std::span<const std::string_view> flags,
                 CliOptions& opts,
                 std::string& error) {
    for (std::size_t i = 0; i < flags.size(); ++i) {
        const std::string_view flag = flags[i];

        if (flag == "--deterministic") {
            opts.engine.mode = ExecutionMode::Deterministic;
            continue;
        }
        if (flag == "--verbose") {
            opts.engine.verbose = true;
            continue;
        }

        double* target = nullptr;
        if      (flag == "--lambda") target = &opts.penalty_weight;
        else if (flag == "--min")    target = &opts.histogram.domain_min;
        else if (flag == "--max")    target = &opts.histogram.domain_max;
        else if (flag == "--gamma1") target = &opts.histogram.entropy_weight;
        else if (flag == "--gamma2") target = &opts.histogram.divergence_weight;
        else if (flag == "--alpha")  target = &opts.ranking.alpha;
        else if (flag == "--beta")   target = &opts.ranking.beta;
        else if (flag != "--bins") {
            error = fmt::format("unknown option '{}'", flag);
            return false;
        }

        if (i + 1 >= flags.size()) {
            error = fmt::format("{} requires a value", flag);
            return false;
        }
        const std::string_view text = flags[++i];

        if (target == nullptr) {
            // --bins
            const auto bins = parse_count(text);
            if (!bins || *bins == 0 || *bins > constants::MAX_NUM_BINS) {
                error = fmt::format("--bins must be an integer in [1, {}], got '{}'",
                                    constants::MAX_NUM_BINS, text);
                return false;
            }
            opts.histogram.num_bins = *bins;
            continue;
        }

        const auto value = parse_real(text);
        if (!value) {
            error = fmt::format("invalid value '{}' for {}", text, flag);
            return false;
        }
        *target = *value;
    }
    return true;
}

} // namespace thermo::cli
