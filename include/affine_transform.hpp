#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <optional>
#include <ostream>

namespace cavegeo
{

  /**
   * Maps (x, y) to (a*x + b*y + c, d*x + e*y + f).
   * Coefficient naming follows the world-file / rasterio convention.
   */
  struct AffineTransform
  {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;
    double e = 1.0;
    double f = 0.0;

    static AffineTransform identity();
    static AffineTransform translation(double tx, double ty);
    static AffineTransform scale(double sx, double sy);
    /** Counter-clockwise rotation about the origin. Exact for multiples of 90 degrees. */
    static AffineTransform rotation(double angle_deg);

    /** Composition: the right-hand transform is applied first. */
    AffineTransform operator*(const AffineTransform &rhs) const;

    cv::Point2d apply(const cv::Point2d &p) const;
    double determinant() const { return a * e - b * d; }
    std::optional<AffineTransform> inverse() const;

    cv::Matx33d to_matx() const;
    static AffineTransform from_matx(const cv::Matx33d &m);

    /** GDAL order: origin x, pixel width, row rotation, origin y, column rotation, pixel height. */
    std::array<double, 6> to_gdal() const;
    static AffineTransform from_gdal(const double geo_transform[6]);
  };

  std::ostream &operator<<(std::ostream &os, const AffineTransform &t);

}
