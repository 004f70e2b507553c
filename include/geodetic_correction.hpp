#pragma once

#include <optional>
#include <string>

namespace cavegeo
{

  /** Central meridian of a projected CRS that has a convergence approximation, if any. */
  std::optional<double> convergence_central_meridian(const std::string &target_crs);

  /**
   * Grid (meridian) convergence in degrees at a WGS84 position: the clockwise rotation
   * of grid north relative to true north. Uses (lambda0 - lambda) * sin(phi).
   * CRSs without an entry return 0.0. Throws std::out_of_range for invalid lat/lon.
   */
  double convergence(double latitude_deg, double longitude_deg, const std::string &target_crs);

}
