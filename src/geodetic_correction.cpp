#include "geodetic_correction.hpp"
#include "config.hpp"
#include <cmath>
#include <stdexcept>

namespace cavegeo
{

  namespace
  {
    constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

    struct ConvergenceModel
    {
      const char *crs;
      double central_meridian_deg;
    };

    const ConvergenceModel CONVERGENCE_MODELS[] = {
        {"EPSG:2180", Config::PL1992_CENTRAL_MERIDIAN_DEG}};
  }

  std::optional<double> convergence_central_meridian(const std::string &target_crs)
  {
    for (const auto &m : CONVERGENCE_MODELS)
    {
      if (target_crs == m.crs)
        return m.central_meridian_deg;
    }
    return std::nullopt;
  }

  double convergence(double latitude_deg, double longitude_deg, const std::string &target_crs)
  {
    if (!(latitude_deg >= -90.0 && latitude_deg <= 90.0))
      throw std::out_of_range("latitude outside [-90, 90]: " + std::to_string(latitude_deg));
    if (!(longitude_deg >= -180.0 && longitude_deg <= 180.0))
      throw std::out_of_range("longitude outside [-180, 180]: " + std::to_string(longitude_deg));

    auto central_meridian = convergence_central_meridian(target_crs);
    if (!central_meridian.has_value())
      return 0.0;
    return (*central_meridian - longitude_deg) * std::sin(latitude_deg * DEG_TO_RAD);
  }

}
