#include "georeferencing_orchestrator.hpp"
#include "affine_composer.hpp"
#include "geodetic_correction.hpp"
#include "measurement_session.hpp"
#include <opencv2/core.hpp>
#include <iomanip>

namespace cavegeo
{

  bool is_missing_coordinate(const GeoCoordinate &geo)
  {
    return geo.latitude == 0.0 && geo.longitude == 0.0;
  }

  GeoreferencingOrchestrator::GeoreferencingOrchestrator(CrsProjector &projector, SessionIo io, RunLog &log,
                                                         bool apply_grid_convergence)
      : projector_(projector), io_(io), log_(log), apply_grid_convergence_(apply_grid_convergence) {}

  GeoreferenceOutcome GeoreferencingOrchestrator::run(const GeoCoordinate &reference, const std::string &target_crs)
  {
    try
    {
      return run_unchecked(reference, target_crs);
    }
    catch (const InvalidMeasurement &e)
    {
      log_.error("Invalid measurement: ", e.what());
      return Failure{std::string("invalid measurement: ") + e.what()};
    }
    catch (const cv::Exception &e)
    {
      log_.error("OpenCV error: ", e.what());
      return Failure{std::string("OpenCV error: ") + e.what()};
    }
    catch (const std::exception &e)
    {
      log_.error("Georeferencing failed: ", e.what());
      return Failure{e.what()};
    }
  }

  GeoreferenceOutcome GeoreferencingOrchestrator::run_unchecked(const GeoCoordinate &reference,
                                                                const std::string &target_crs)
  {
    if (!(reference.latitude >= -90.0 && reference.latitude <= 90.0) ||
        !(reference.longitude >= -180.0 && reference.longitude <= 180.0))
    {
      log_.error("Reference coordinate out of range (lat=", reference.latitude, ", lon=", reference.longitude, ")");
      return Failure{"reference coordinate out of range"};
    }
    if (is_missing_coordinate(reference))
      log_.warn("Cave has no valid coordinates (0,0). Georeferencing will place it at null island.");

    log_.info("Calculating transform for target CRS: ", target_crs);
    auto reference_world = projector_.to_projected(reference, target_crs);
    if (!reference_world.has_value())
    {
      log_.error("Could not project (lat=", reference.latitude, ", lon=", reference.longitude, ") to ", target_crs);
      return Failure{"could not project reference coordinate to " + target_crs};
    }
    log_.info("Entrance projected coordinates: X=", std::fixed, std::setprecision(2), reference_world->x,
              ", Y=", reference_world->y);

    MeasurementSession session(io_.events, io_.prompt, io_.view, log_);
    SessionOutcome outcome = session.run();
    if (std::holds_alternative<SessionCancelled>(outcome))
      return Cancelled{};
    const PlanMeasurements &measurements = std::get<PlanMeasurements>(outcome);

    double convergence_deg = 0.0;
    if (apply_grid_convergence_)
    {
      convergence_deg = convergence(reference.latitude, reference.longitude, target_crs);
      if (convergence_central_meridian(target_crs).has_value())
        log_.info("Meridian convergence at entrance: ", std::fixed, std::setprecision(4), convergence_deg,
                  " degrees (lat=", std::setprecision(6), reference.latitude, ", lon=", reference.longitude, ")");
      else
        log_.info("No grid convergence model for ", target_crs, "; no grid correction applied.");
    }

    log_.info("Total rotation (clockwise from image top): ", std::fixed, std::setprecision(4),
              total_clockwise_rotation_deg(measurements, convergence_deg),
              " deg (north_angle=", orientation_angle_deg(measurements.orientation),
              ", declination=", measurements.declination_deg,
              ", meridian_conv=", convergence_deg, ")");

    GeoreferenceResult result;
    result.transform = compose_transform(measurements, *reference_world, convergence_deg);
    result.target_crs = target_crs;
    result.reference_world = *reference_world;
    result.convergence_deg = convergence_deg;
    log_.info("Final Affine Transform Matrix:\n", result.transform);
    return result;
  }

}
