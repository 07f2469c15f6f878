/// @file tests/core/test_errors.cpp
/// @brief Tests for the stint exception hierarchy and threshold validation.

#include "stint/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace stint;

TEST(ErrorsTest, message_is_prefixed_with_kind) {
    const InvalidThreshold e("delta must be >= 0");
    EXPECT_EQ(std::string(e.what()), "InvalidThreshold: delta must be >= 0");
    EXPECT_EQ(e.kind(), ErrorKind::InvalidThreshold);
}

TEST(ErrorsTest, subclasses_are_catchable_as_base) {
    try {
        throw NumericDegeneracy("constant vector");
    } catch (const StintError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NumericDegeneracy);
        return;
    }
    FAIL() << "NumericDegeneracy was not caught as StintError";
}

TEST(ErrorsTest, every_kind_has_a_name) {
    EXPECT_STREQ(to_string(ErrorKind::InvalidInputSize),  "InvalidInputSize");
    EXPECT_STREQ(to_string(ErrorKind::InvalidThreshold),  "InvalidThreshold");
    EXPECT_STREQ(to_string(ErrorKind::InvalidCoordinate), "InvalidCoordinate");
    EXPECT_STREQ(to_string(ErrorKind::NumericDegeneracy), "NumericDegeneracy");
}

TEST(ErrorsTest, require_threshold_accepts_zero_and_positive) {
    EXPECT_NO_THROW(require_threshold(0.0, "delta"));
    EXPECT_NO_THROW(require_threshold(12.5, "tau"));
}

TEST(ErrorsTest, require_threshold_rejects_negative_and_non_finite) {
    EXPECT_THROW(require_threshold(-1e-9, "delta"), InvalidThreshold);
    EXPECT_THROW(require_threshold(std::nan(""), "tau"), InvalidThreshold);
    EXPECT_THROW(require_threshold(std::numeric_limits<double>::infinity(), "tau"),
                 InvalidThreshold);
}
