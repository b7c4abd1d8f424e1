#pragma once

/// @file include/thermo/cli_options.hpp
/// @brief Option flags of the `thermo` command-line tool.
///
/// # Module: CLI Options
///
/// ## Responsibility
/// Turn the flags that follow `thermo <command> <csv_file>` into the
/// configuration structs of the core.
///
/// ## Guarantees
/// - Every flag value is checked before it reaches the core: real-valued
///   flags must parse completely and be finite, `--bins` must be a whole
///   number in [1, MAX_NUM_BINS]
/// - On failure the options are left unspecified and a one-line message
///   is returned for the caller to print

#include "thermo/constants.hpp"
#include "thermo/engine.hpp"
#include "thermo/information_gain.hpp"
#include "thermo/ranking.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace thermo::cli {

struct CliOptions {
    std::string                  filepath;
    double                       penalty_weight = constants::DEFAULT_PENALTY_WEIGHT;
    information::HistogramConfig histogram{};
    ranking::RankingConfig       ranking{};
    core::EngineConfig           engine{};
};

/// Parse a complete, finite real number. Rejects empty input, trailing
/// characters, "nan" and "inf".
[[nodiscard]] std::optional<double> parse_real(std::string_view text) noexcept;

/// Parse a complete unsigned decimal integer ("2.7", "-1", "1e3" fail).
[[nodiscard]] std::optional<std::size_t> parse_count(std::string_view text) noexcept;

/// Apply `flags` (argv[3..]) to `opts`.
///
/// Returns false and fills `error` (without the "Error: " prefix) on the
/// first unknown flag, missing value or invalid value.
[[nodiscard]] bool parse_flags(std::span<const std::string_view> flags,
                               CliOptions& opts,
                               std::string& error);

} // namespace thermo::cli
