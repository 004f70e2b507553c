#include <gtest/gtest.h>
#include "affine_transform.hpp"
#include <cmath>
#include <sstream>

using cavegeo::AffineTransform;

TEST(AffineTransformTest, IdentityLeavesPointsUnchanged)
{
  cv::Point2d p = AffineTransform::identity().apply({12.5, -3.0});
  EXPECT_DOUBLE_EQ(p.x, 12.5);
  EXPECT_DOUBLE_EQ(p.y, -3.0);
}

TEST(AffineTransformTest, TranslationAndScale)
{
  cv::Point2d t = AffineTransform::translation(10.0, -5.0).apply({1.0, 2.0});
  EXPECT_DOUBLE_EQ(t.x, 11.0);
  EXPECT_DOUBLE_EQ(t.y, -3.0);

  cv::Point2d s = AffineTransform::scale(0.5, -2.0).apply({4.0, 3.0});
  EXPECT_DOUBLE_EQ(s.x, 2.0);
  EXPECT_DOUBLE_EQ(s.y, -6.0);
}

TEST(AffineTransformTest, RotationIsCounterClockwiseAndExactAtQuarterTurns)
{
  AffineTransform r90 = AffineTransform::rotation(90.0);
  EXPECT_EQ(r90.a, 0.0);
  EXPECT_EQ(r90.b, -1.0);
  EXPECT_EQ(r90.d, 1.0);
  EXPECT_EQ(r90.e, 0.0);
  cv::Point2d p = r90.apply({1.0, 0.0});
  EXPECT_EQ(p.x, 0.0);
  EXPECT_EQ(p.y, 1.0);

  cv::Point2d q = AffineTransform::rotation(-90.0).apply({0.0, 1.0});
  EXPECT_EQ(q.x, 1.0);
  EXPECT_EQ(q.y, 0.0);

  cv::Point2d h = AffineTransform::rotation(450.0).apply({1.0, 0.0});
  EXPECT_EQ(h.x, 0.0);
  EXPECT_EQ(h.y, 1.0);

  cv::Point2d d = AffineTransform::rotation(45.0).apply({1.0, 0.0});
  EXPECT_NEAR(d.x, std::sqrt(0.5), 1e-12);
  EXPECT_NEAR(d.y, std::sqrt(0.5), 1e-12);
}

TEST(AffineTransformTest, CompositionAppliesRightHandSideFirst)
{
  AffineTransform t = AffineTransform::translation(10.0, 0.0);
  AffineTransform s = AffineTransform::scale(2.0, 2.0);

  cv::Point2d scale_then_move = (t * s).apply({1.0, 1.0});
  EXPECT_DOUBLE_EQ(scale_then_move.x, 12.0);
  EXPECT_DOUBLE_EQ(scale_then_move.y, 2.0);

  cv::Point2d move_then_scale = (s * t).apply({1.0, 1.0});
  EXPECT_DOUBLE_EQ(move_then_scale.x, 22.0);
  EXPECT_DOUBLE_EQ(move_then_scale.y, 2.0);
}

TEST(AffineTransformTest, InverseUndoesTransform)
{
  AffineTransform t = AffineTransform::translation(100.0, 200.0) * AffineTransform::rotation(30.0) *
                      AffineTransform::scale(0.25, -0.25);
  auto inv = t.inverse();
  ASSERT_TRUE(inv.has_value());
  cv::Point2d p = inv->apply(t.apply({37.0, -11.0}));
  EXPECT_NEAR(p.x, 37.0, 1e-9);
  EXPECT_NEAR(p.y, -11.0, 1e-9);
}

TEST(AffineTransformTest, SingularTransformHasNoInverse)
{
  EXPECT_FALSE(AffineTransform::scale(0.0, 1.0).inverse().has_value());
}

TEST(AffineTransformTest, GdalOrderRoundTrip)
{
  AffineTransform t{1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
  std::array<double, 6> gt = t.to_gdal();
  EXPECT_EQ(gt[0], 3.0);
  EXPECT_EQ(gt[1], 1.0);
  EXPECT_EQ(gt[2], 2.0);
  EXPECT_EQ(gt[3], 6.0);
  EXPECT_EQ(gt[4], 4.0);
  EXPECT_EQ(gt[5], 5.0);

  AffineTransform back = AffineTransform::from_gdal(gt.data());
  EXPECT_EQ(back.a, t.a);
  EXPECT_EQ(back.b, t.b);
  EXPECT_EQ(back.c, t.c);
  EXPECT_EQ(back.d, t.d);
  EXPECT_EQ(back.e, t.e);
  EXPECT_EQ(back.f, t.f);
}

TEST(AffineTransformTest, StreamsAsMatrixRows)
{
  std::ostringstream os;
  os << AffineTransform::translation(1.0, 2.0);
  EXPECT_EQ(os.str(), "|1.000000, 0.000000, 1.000000|\n"
                      "|0.000000, 1.000000, 2.000000|\n"
                      "|0.000000, 0.000000, 1.000000|");
}
