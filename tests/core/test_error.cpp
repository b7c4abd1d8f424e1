/// @file tests/core/test_error.cpp
/// @brief Error taxonomy rendering and Result<T> access.

#include "thermo/error.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace thermo;

// ════════════════════════════════════════════════════════════════════════════
// ErrorRendering
// ════════════════════════════════════════════════════════════════════════════

TEST(ErrorRendering, KindNames) {
    EXPECT_STREQ(to_string(ErrorKind::DimensionMismatch), "DimensionMismatch");
    EXPECT_STREQ(to_string(ErrorKind::ZeroProbabilitySpace), "ZeroProbabilitySpace");
    EXPECT_STREQ(to_string(ErrorKind::NumericalInstability), "NumericalInstability");
}

TEST(ErrorRendering, DimensionMismatchCarriesSizes) {
    const auto msg = Error::dimension_mismatch(7, 3).to_string();
    EXPECT_NE(msg.find("expected 7"), std::string::npos) << msg;
    EXPECT_NE(msg.find("found 3"), std::string::npos) << msg;
}

TEST(ErrorRendering, EveryKindHasMessage) {
    EXPECT_FALSE(Error::zero_probability_space().to_string().empty());
    EXPECT_FALSE(Error::numerical_instability().to_string().empty());
    EXPECT_NE(Error::zero_probability_space().to_string(),
              Error::numerical_instability().to_string());
}

TEST(ErrorRendering, Equality) {
    EXPECT_EQ(Error::dimension_mismatch(1, 2), Error::dimension_mismatch(1, 2));
    EXPECT_NE(Error::dimension_mismatch(1, 2), Error::dimension_mismatch(2, 1));
    EXPECT_NE(Error::zero_probability_space(), Error::numerical_instability());
}

// ════════════════════════════════════════════════════════════════════════════
// ResultAccess
// ════════════════════════════════════════════════════════════════════════════

TEST(ResultAccess, HoldsValue) {
    Result<std::vector<double>> r(std::vector<double>{1.0, 2.0});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r->size(), 2u);
    EXPECT_EQ((*r)[1], 2.0);
}

TEST(ResultAccess, HoldsError) {
    Result<int> r(Error::numerical_instability());
    EXPECT_FALSE(r.has_value());
    EXPECT_FALSE(static_cast<bool>(r));
    EXPECT_EQ(r.error().kind, ErrorKind::NumericalInstability);
}

TEST(ResultAccess, MoveOutValue) {
    Result<std::unique_ptr<int>> r(std::make_unique<int>(42));
    std::unique_ptr<int> p = std::move(r).value();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 42);
}
