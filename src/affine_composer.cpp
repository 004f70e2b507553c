#include "affine_composer.hpp"
#include "config.hpp"
#include "measurement_session.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace cavegeo
{

  double pixels_per_meter(const ScaleMeasurement &scale)
  {
    if (!(scale.distance_m > 0.0) || !std::isfinite(scale.distance_m))
      throw InvalidMeasurement("scale distance must be positive, got " + std::to_string(scale.distance_m));
    double ppm = pixel_distance(scale.start, scale.end) / scale.distance_m;
    if (!(ppm > 0.0) || !std::isfinite(ppm))
      throw InvalidMeasurement("scale pixels per meter must be positive (zero-length scale bar?)");
    return ppm;
  }

  double total_clockwise_rotation_deg(const PlanMeasurements &measurements, double convergence_deg)
  {
    return orientation_angle_deg(measurements.orientation) + measurements.declination_deg + convergence_deg;
  }

  AffineTransform compose_transform(const PixelPoint &reference_pixel, double meters_per_pixel,
                                    double clockwise_deg, const WorldPoint &reference_world)
  {
    if (!(meters_per_pixel > 0.0) || !std::isfinite(meters_per_pixel))
      throw InvalidMeasurement("meters per pixel must be positive");
    if (!std::isfinite(clockwise_deg))
      throw InvalidMeasurement("rotation angle is not finite");

    AffineTransform to_origin = AffineTransform::translation(-reference_pixel.x, -reference_pixel.y);
    // Image y grows down, world y grows north.
    AffineTransform to_meters = AffineTransform::scale(meters_per_pixel, -meters_per_pixel);
    AffineTransform rotate = AffineTransform::rotation(-clockwise_deg);
    AffineTransform to_world = AffineTransform::translation(reference_world.x, reference_world.y);

    AffineTransform result = to_world * rotate * to_meters * to_origin;

    cv::Point2d anchor = result.apply(cv::Point2d(reference_pixel.x, reference_pixel.y));
    double tolerance = Config::ANCHOR_TOLERANCE *
                       std::max({1.0, std::abs(reference_world.x), std::abs(reference_world.y)});
    if (!(std::abs(anchor.x - reference_world.x) <= tolerance) ||
        !(std::abs(anchor.y - reference_world.y) <= tolerance))
      throw InvalidMeasurement("composed transform does not keep the reference point fixed");
    return result;
  }

  AffineTransform compose_transform(const PlanMeasurements &measurements, const WorldPoint &reference_world,
                                    double convergence_deg)
  {
    double meters_per_pixel = 1.0 / pixels_per_meter(measurements.scale);
    return compose_transform(measurements.reference, meters_per_pixel,
                             total_clockwise_rotation_deg(measurements, convergence_deg), reference_world);
  }

}
