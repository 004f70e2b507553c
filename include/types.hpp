#pragma once

#include "affine_transform.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <variant>

namespace cavegeo
{

  /** Image pixel, origin top-left, y grows downward. */
  using PixelPoint = cv::Point2i;
  /** Projected CRS coordinate in metres, y grows northward. */
  using WorldPoint = cv::Point2d;

  /** WGS84 position in degrees. */
  struct GeoCoordinate
  {
    double latitude = 0.0;
    double longitude = 0.0;
  };

  struct ScaleMeasurement
  {
    PixelPoint start;
    PixelPoint end;
    double distance_m = 0.0;
  };

  /** North assumed straight up on the plan. */
  struct NorthSkipped
  {
  };

  /** North arrow drawn on the plan, from its base to its tip. */
  struct NorthMeasured
  {
    PixelPoint base;
    PixelPoint tip;
  };

  using OrientationMeasurement = std::variant<NorthSkipped, NorthMeasured>;

  /** Everything a completed measurement session captured. */
  struct PlanMeasurements
  {
    PixelPoint reference;
    ScaleMeasurement scale;
    OrientationMeasurement orientation = NorthSkipped{};
    double declination_deg = 0.0;
  };

  struct GeoreferenceResult
  {
    AffineTransform transform;
    std::string target_crs;
    WorldPoint reference_world;
    double convergence_deg = 0.0;
  };

}
