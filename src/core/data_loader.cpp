/// @file src/core/data_loader.cpp
/// @brief CSV loader for thermoelectric measurement tables.

#include "thermo/data_loader.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace thermo::core {

namespace {

constexpr std::size_t REQUIRED_NUMERIC_FIELDS = 7;
constexpr std::size_t MAX_NUMERIC_FIELDS      = 8;

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<double> parse_double(std::string_view token) noexcept {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    double val = 0.0;
    const auto* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), end, val);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;  // not a number or trailing garbage
    }
    if (!std::isfinite(val)) {
        return std::nullopt;
    }
    return val;
}

} // anonymous namespace

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<ObservationRow> DataLoader::parse_row(std::string_view line) {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::array<double, MAX_NUMERIC_FIELDS> fields{};
    std::size_t field_count = 0;
    std::string_view material;
    bool first = true;

    while (true) {
        const auto comma = line.find(',');
        const auto token = trim(line.substr(0, comma));
        if (token.empty()) {
            return std::nullopt;  // empty token
        }

        if (first) {
            material = token;
            first = false;
        } else {
            if (field_count == MAX_NUMERIC_FIELDS) {
                return std::nullopt;  // too many columns
            }
            auto val = parse_double(token);
            if (!val) {
                return std::nullopt;
            }
            fields[field_count++] = *val;
        }

        if (comma == std::string_view::npos) break;
        line.remove_prefix(comma + 1);
    }

    if (field_count < REQUIRED_NUMERIC_FIELDS) {
        return std::nullopt;
    }

    return ObservationRow{
        .material                = std::string(material),
        .seebeck                 = fields[0],
        .electrical_conductivity = fields[1],
        .thermal_conductivity    = fields[2],
        .temperature             = fields[3],
        .zt_observed             = fields[4],
        .zt_uncertainty          = fields[5],
        .prior                   = fields[6],
        .citations               = field_count > 7 ? fields[7] : 0.0,
    };
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

ObservationTable DataLoader::parse_csv_string(const std::string& csv_content) {
    std::vector<ObservationRow> rows;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        if (!header_skipped) {
            // First non-blank, non-comment line is the header.
            const auto t = trim(line);
            if (!t.empty() && t.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto row = parse_row(line)) {
            rows.push_back(std::move(*row));
        }
    }

    return ObservationTable::from_rows(std::move(rows));
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<ObservationTable> DataLoader::load_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

// ─── ObservationTable ─────────────────────────────────────────────────────────

ObservationTable ObservationTable::from_rows(std::vector<ObservationRow> rows) {
    std::stable_sort(rows.begin(), rows.end(),
                     [](const ObservationRow& a, const ObservationRow& b) {
                         return a.material < b.material;
                     });

    ObservationTable t;
    const std::size_t n = rows.size();
    t.seebeck_.reserve(n);
    t.electrical_conductivity_.reserve(n);
    t.thermal_conductivity_.reserve(n);
    t.temperature_.reserve(n);
    t.zt_observed_.reserve(n);
    t.zt_uncertainty_.reserve(n);
    t.prior_.reserve(n);
    t.citations_.reserve(n);
    t.row_group_.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const auto& r = rows[i];
        if (t.materials_.empty() || t.materials_.back() != r.material) {
            if (!t.bounds_.empty()) {
                t.bounds_.back().end = i;
            }
            t.materials_.push_back(r.material);
            t.bounds_.push_back(SubsetBounds{i, i});
        }

        t.seebeck_.push_back(r.seebeck);
        t.electrical_conductivity_.push_back(r.electrical_conductivity);
        t.thermal_conductivity_.push_back(r.thermal_conductivity);
        t.temperature_.push_back(r.temperature);
        t.zt_observed_.push_back(r.zt_observed);
        t.zt_uncertainty_.push_back(r.zt_uncertainty);
        t.prior_.push_back(r.prior);
        t.citations_.push_back(r.citations);
        t.row_group_.push_back(t.materials_.size() - 1);
    }
    if (!t.bounds_.empty()) {
        t.bounds_.back().end = n;
    }

    return t;
}

TransportColumns ObservationTable::transport() const noexcept {
    return TransportColumns{
        .seebeck                 = seebeck_,
        .electrical_conductivity = electrical_conductivity_,
        .thermal_conductivity    = thermal_conductivity_,
        .temperature             = temperature_,
        .zt_observed             = zt_observed_,
        .zt_uncertainty          = zt_uncertainty_,
    };
}

ObservationBatch ObservationTable::batch(double penalty_weight) const noexcept {
    return ObservationBatch{
        .columns        = transport(),
        .prior          = prior_,
        .penalty_weight = penalty_weight,
    };
}

const std::string& ObservationTable::material_of(std::size_t row) const {
    return materials_[row_group_[row]];
}

}  // namespace thermo::core
