#pragma once

#include "affine_transform.hpp"
#include "types.hpp"
#include <stdexcept>

namespace cavegeo
{

  /** A measurement the transform cannot be built from (zero-length scale bar, non-positive distance). */
  class InvalidMeasurement : public std::invalid_argument
  {
  public:
    using std::invalid_argument::invalid_argument;
  };

  /** Pixel length of the scale bar divided by its real length. Throws InvalidMeasurement. */
  double pixels_per_meter(const ScaleMeasurement &scale);

  /** Orientation + declination + convergence, all clockwise and additive. */
  double total_clockwise_rotation_deg(const PlanMeasurements &measurements, double convergence_deg);

  /**
   * T2 * R * S * T1: move the reference pixel to the origin, scale to metres with the
   * y axis flipped, rotate by the clockwise angle, move the origin to the world point.
   */
  AffineTransform compose_transform(const PixelPoint &reference_pixel, double meters_per_pixel,
                                    double clockwise_deg, const WorldPoint &reference_world);

  AffineTransform compose_transform(const PlanMeasurements &measurements, const WorldPoint &reference_world,
                                    double convergence_deg);

}
