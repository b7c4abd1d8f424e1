#pragma once

/// @file include/thermo/error.hpp
/// @brief Error taxonomy and the `Result<T>` return type of the Thermo core.
///
/// # Module: Errors
///
/// ## Responsibility
/// Classify every anomaly of a batch call into exactly one of three kinds
/// and carry it back to the caller as a value:
///
///   - DimensionMismatch     - input lengths disagree, or a subset bound
///                             falls outside the shared array. Carries the
///                             expected and found sizes.
///   - ZeroProbabilitySpace  - every hypothesis received −∞ or NaN
///                             unnormalised mass. Never defaulted to a
///                             uniform posterior.
///   - NumericalInstability  - the log-sum-exp denominator is not finite,
///                             or the histogram domain is invalid
///                             (zero or too many bins, max ≤ min).
///
/// ## Guarantees
/// - Nothing in the core throws; a `Result` holds either a value or an Error
/// - A failed call returns no partial output

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace thermo {

// ─── ErrorKind ────────────────────────────────────────────────────────────────

enum class ErrorKind {
    DimensionMismatch,
    ZeroProbabilitySpace,
    NumericalInstability,
};

/// Short stable name of an error kind ("DimensionMismatch", ...).
[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

// ─── Error ────────────────────────────────────────────────────────────────────

struct Error {
    ErrorKind   kind;
    std::size_t expected = 0; ///< DimensionMismatch only
    std::size_t found    = 0; ///< DimensionMismatch only

    [[nodiscard]] static Error dimension_mismatch(std::size_t expected,
                                                  std::size_t found) noexcept {
        return Error{ErrorKind::DimensionMismatch, expected, found};
    }

    [[nodiscard]] static Error zero_probability_space() noexcept {
        return Error{ErrorKind::ZeroProbabilitySpace};
    }

    [[nodiscard]] static Error numerical_instability() noexcept {
        return Error{ErrorKind::NumericalInstability};
    }

    /// Human-readable one-line description.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Error&) const = default;
};

// ─── Result ───────────────────────────────────────────────────────────────────

/// Either a value of type T or an Error.
///
/// Usage mirrors `std::optional`:
/// ```cpp
/// auto r = engine.posterior(batch);
/// if (!r) { fmt::print(stderr, "{}\n", r.error().to_string()); return 1; }
/// use(r->probabilities);
/// ```
/// Accessing `value()` on an error, or `error()` on a value, is a
/// precondition violation.
template <typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, error) {}

    [[nodiscard]] bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T&       value() &       { return *std::get_if<0>(&state_); }
    [[nodiscard]] const T& value() const&  { return *std::get_if<0>(&state_); }
    [[nodiscard]] T&&      value() &&      { return std::move(*std::get_if<0>(&state_)); }

    [[nodiscard]] const Error& error() const { return *std::get_if<1>(&state_); }

    T&       operator*() &       { return value(); }
    const T& operator*() const&  { return value(); }
    T&&      operator*() &&      { return std::move(*this).value(); }

    T*       operator->()       { return std::get_if<0>(&state_); }
    const T* operator->() const { return std::get_if<0>(&state_); }

private:
    std::variant<T, Error> state_;
};

} // namespace thermo
