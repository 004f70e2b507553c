#include <gtest/gtest.h>
#include "geodetic_correction.hpp"
#include <cmath>
#include <stdexcept>

using cavegeo::convergence;
using cavegeo::convergence_central_meridian;

namespace
{
  constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
}

TEST(GeodeticCorrectionTest, ZeroOnCentralMeridian)
{
  EXPECT_DOUBLE_EQ(convergence(50.0, 19.0, "EPSG:2180"), 0.0);
}

TEST(GeodeticCorrectionTest, EastOfCentralMeridianIsNegative)
{
  double expected = (19.0 - 20.0) * std::sin(50.0 * DEG_TO_RAD);
  EXPECT_NEAR(convergence(50.0, 20.0, "EPSG:2180"), expected, 1e-12);
  EXPECT_LT(convergence(50.0, 20.0, "EPSG:2180"), 0.0);
}

TEST(GeodeticCorrectionTest, WestOfCentralMeridianIsPositive)
{
  EXPECT_NEAR(convergence(52.0, 15.0, "EPSG:2180"), 4.0 * std::sin(52.0 * DEG_TO_RAD), 1e-12);
  EXPECT_GT(convergence(52.0, 15.0, "EPSG:2180"), 0.0);
}

TEST(GeodeticCorrectionTest, UnknownCrsHasNoCorrection)
{
  EXPECT_EQ(convergence(50.0, 20.0, "EPSG:3857"), 0.0);
  EXPECT_EQ(convergence(50.0, 20.0, ""), 0.0);
  EXPECT_EQ(convergence(50.0, 20.0, "epsg:2180"), 0.0);
  EXPECT_FALSE(convergence_central_meridian("EPSG:32634").has_value());
}

TEST(GeodeticCorrectionTest, CentralMeridianLookup)
{
  auto meridian = convergence_central_meridian("EPSG:2180");
  ASSERT_TRUE(meridian.has_value());
  EXPECT_DOUBLE_EQ(*meridian, 19.0);
}

TEST(GeodeticCorrectionTest, ZeroAtEquator)
{
  EXPECT_NEAR(convergence(0.0, 25.0, "EPSG:2180"), 0.0, 1e-15);
}

TEST(GeodeticCorrectionTest, RejectsOutOfRangeInput)
{
  EXPECT_THROW(convergence(90.5, 19.0, "EPSG:2180"), std::out_of_range);
  EXPECT_THROW(convergence(-91.0, 19.0, "EPSG:2180"), std::out_of_range);
  EXPECT_THROW(convergence(50.0, 180.1, "EPSG:2180"), std::out_of_range);
  EXPECT_THROW(convergence(std::nan(""), 19.0, "EPSG:2180"), std::out_of_range);
  EXPECT_NO_THROW(convergence(90.0, -180.0, "EPSG:2180"));
}
