#include <gtest/gtest.h>

#include "core/errors.h"
#include "dose/dose_units.h"

using namespace DoseProfile;

TEST(DoseUnitsTest, ParsesDicomSpellings) {
    EXPECT_EQ(parseDoseUnit("GY"), DoseUnit::Gy);
    EXPECT_EQ(parseDoseUnit(" cGy "), DoseUnit::CGy);
    EXPECT_EQ(parseDoseUnit("relative"), DoseUnit::Relative);
    EXPECT_THROW(parseDoseUnit("MGY"), InvalidDoseUnitError);
    EXPECT_THROW(parseDoseUnit(""), InvalidDoseUnitError);
}

TEST(DoseUnitsTest, ConversionFactors) {
    EXPECT_DOUBLE_EQ(doseConversionFactor(DoseUnit::Gy, DoseUnit::Gy), 1.0);
    EXPECT_DOUBLE_EQ(doseConversionFactor(DoseUnit::Gy, DoseUnit::CGy), 100.0);
    EXPECT_DOUBLE_EQ(doseConversionFactor(DoseUnit::CGy, DoseUnit::CGy), 1.0);
}

TEST(DoseUnitsTest, CGyGridCannotBeReportedInGy) {
    EXPECT_THROW(doseConversionFactor(DoseUnit::CGy, DoseUnit::Gy), InvalidDoseUnitError);
}

TEST(DoseUnitsTest, RelativeIsRejected) {
    EXPECT_THROW(doseConversionFactor(DoseUnit::Relative, DoseUnit::Gy), UnsupportedDoseUnitError);
    EXPECT_THROW(doseConversionFactor(DoseUnit::Relative, DoseUnit::Relative), UnsupportedDoseUnitError);
    EXPECT_THROW(doseConversionFactor(DoseUnit::Gy, DoseUnit::Relative), InvalidDoseUnitError);
}
