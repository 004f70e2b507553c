#include "affine_transform.hpp"
#include <cmath>
#include <iomanip>

namespace cavegeo
{

  namespace
  {
    constexpr double SINGULAR_EPS = 1e-15;

    void cos_sin_deg(double deg, double &cos_a, double &sin_a)
    {
      double r = std::fmod(deg, 360.0);
      if (r < 0)
        r += 360.0;
      if (r == 0.0)
      {
        cos_a = 1.0;
        sin_a = 0.0;
      }
      else if (r == 90.0)
      {
        cos_a = 0.0;
        sin_a = 1.0;
      }
      else if (r == 180.0)
      {
        cos_a = -1.0;
        sin_a = 0.0;
      }
      else if (r == 270.0)
      {
        cos_a = 0.0;
        sin_a = -1.0;
      }
      else
      {
        double rad = deg * CV_PI / 180.0;
        cos_a = std::cos(rad);
        sin_a = std::sin(rad);
      }
    }
  }

  AffineTransform AffineTransform::identity() { return AffineTransform{}; }

  AffineTransform AffineTransform::translation(double tx, double ty)
  {
    return AffineTransform{1.0, 0.0, tx, 0.0, 1.0, ty};
  }

  AffineTransform AffineTransform::scale(double sx, double sy)
  {
    return AffineTransform{sx, 0.0, 0.0, 0.0, sy, 0.0};
  }

  AffineTransform AffineTransform::rotation(double angle_deg)
  {
    double ca, sa;
    cos_sin_deg(angle_deg, ca, sa);
    // 0.0 - sa keeps b at +0.0 when sa is zero.
    return AffineTransform{ca, 0.0 - sa, 0.0, sa, ca, 0.0};
  }

  AffineTransform AffineTransform::operator*(const AffineTransform &rhs) const
  {
    return from_matx(to_matx() * rhs.to_matx());
  }

  cv::Point2d AffineTransform::apply(const cv::Point2d &p) const
  {
    return {a * p.x + b * p.y + c, d * p.x + e * p.y + f};
  }

  std::optional<AffineTransform> AffineTransform::inverse() const
  {
    if (std::abs(determinant()) < SINGULAR_EPS)
      return std::nullopt;
    return from_matx(to_matx().inv(cv::DECOMP_LU));
  }

  cv::Matx33d AffineTransform::to_matx() const
  {
    return cv::Matx33d(a, b, c,
                       d, e, f,
                       0.0, 0.0, 1.0);
  }

  AffineTransform AffineTransform::from_matx(const cv::Matx33d &m)
  {
    return AffineTransform{m(0, 0), m(0, 1), m(0, 2), m(1, 0), m(1, 1), m(1, 2)};
  }

  std::array<double, 6> AffineTransform::to_gdal() const
  {
    return {c, a, b, f, d, e};
  }

  AffineTransform AffineTransform::from_gdal(const double geo_transform[6])
  {
    return AffineTransform{geo_transform[1], geo_transform[2], geo_transform[0],
                           geo_transform[4], geo_transform[5], geo_transform[3]};
  }

  std::ostream &operator<<(std::ostream &os, const AffineTransform &t)
  {
    std::ios_base::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(6)
       << "|" << t.a << ", " << t.b << ", " << t.c << "|\n"
       << "|" << t.d << ", " << t.e << ", " << t.f << "|\n"
       << "|0.000000, 0.000000, 1.000000|";
    os.flags(flags);
    os.precision(precision);
    return os;
  }

}
