#pragma once

/// @file include/thermo/data_loader.hpp
/// @brief CSV loader for thermoelectric measurement tables.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV measurement files into an `ObservationTable`: owned,
/// equal-length columns grouped by material, ready to hand to the Engine.
///
/// ## Expected CSV Format
/// ```
/// material,S,sigma,kappa,T,zt,zt_err,prior,citations
/// Bi2Te3,2.0e-4,1.0e5,1.5,300,0.8,0.05,1.0,120
/// PbTe,1.8e-4,5.0e4,1.2,600,0.9,0.1,1.0
/// ```
/// The first line is treated as a header and skipped. The citations column
/// is optional and defaults to 0.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Skips blank, comment, malformed and non-finite rows rather than
///   failing the entire load
/// - Rows are stably grouped by material id, so each material occupies one
///   contiguous [start, end) range of every column

#include "thermo/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace thermo::core {

// ─── ObservationRow ───────────────────────────────────────────────────────────

/// One parsed CSV row.
struct ObservationRow {
    std::string material;
    double seebeck                 = 0.0;
    double electrical_conductivity = 0.0;
    double thermal_conductivity    = 0.0;
    double temperature             = 0.0;
    double zt_observed             = 0.0;
    double zt_uncertainty          = 0.0;
    double prior                   = 0.0;
    double citations               = 0.0;
};

// ─── ObservationTable ─────────────────────────────────────────────────────────

/// Column store of a measurement file, grouped by material.
///
/// Views returned by `transport()` and `batch()` point into this table and
/// are invalidated when it is destroyed or moved from.
class ObservationTable {
public:
    ObservationTable() = default;

    /// Stable-sort `rows` by material id and split into columns.
    [[nodiscard]] static ObservationTable from_rows(std::vector<ObservationRow> rows);

    [[nodiscard]] std::size_t size() const noexcept { return seebeck_.size(); }
    [[nodiscard]] bool empty() const noexcept { return seebeck_.empty(); }

    [[nodiscard]] TransportColumns transport() const noexcept;
    [[nodiscard]] ObservationBatch batch(double penalty_weight) const noexcept;

    [[nodiscard]] std::span<const double> temperature() const noexcept { return temperature_; }
    [[nodiscard]] std::span<const double> zt_observed() const noexcept { return zt_observed_; }
    [[nodiscard]] std::span<const double> prior() const noexcept { return prior_; }
    [[nodiscard]] std::span<const double> citations() const noexcept { return citations_; }

    /// Distinct material ids, in the order of `material_bounds()`.
    [[nodiscard]] const std::vector<std::string>& materials() const noexcept {
        return materials_;
    }

    /// One [start, end) range per material.
    [[nodiscard]] const std::vector<SubsetBounds>& material_bounds() const noexcept {
        return bounds_;
    }

    /// Material id of row i.
    [[nodiscard]] const std::string& material_of(std::size_t row) const;

private:
    std::vector<double> seebeck_;
    std::vector<double> electrical_conductivity_;
    std::vector<double> thermal_conductivity_;
    std::vector<double> temperature_;
    std::vector<double> zt_observed_;
    std::vector<double> zt_uncertainty_;
    std::vector<double> prior_;
    std::vector<double> citations_;

    std::vector<std::string>  materials_;
    std::vector<SubsetBounds> bounds_;
    std::vector<std::size_t>  row_group_; ///< row → index into materials_
};

// ─── DataLoader ───────────────────────────────────────────────────────────────

class DataLoader {
public:
    /// Load a measurement table from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty table if the file has a header but no valid data rows
    [[nodiscard]] static std::optional<ObservationTable>
    load_csv(const std::string& filepath);

    /// Parse a CSV-formatted string (same format as `load_csv`).
    [[nodiscard]] static ObservationTable
    parse_csv_string(const std::string& csv_content);

    /// Parse one data row. `nullopt` for blank, comment or malformed rows,
    /// and for rows with any non-finite numeric field.
    [[nodiscard]] static std::optional<ObservationRow>
    parse_row(std::string_view line);
};

}  // namespace thermo::core
