#pragma once

#include "crs_projector.hpp"
#include "input_events.hpp"
#include "run_log.hpp"
#include "types.hpp"
#include <string>
#include <variant>

namespace cavegeo
{

  struct Cancelled
  {
  };

  struct Failure
  {
    std::string reason;
  };

  using GeoreferenceOutcome = std::variant<GeoreferenceResult, Cancelled, Failure>;

  /** The interactive collaborators one run needs. */
  struct SessionIo
  {
    InputEventSource &events;
    TextPrompt &prompt;
    MeasurementView &view;
  };

  /** True when upstream data carried no coordinate (both fields exactly zero). */
  bool is_missing_coordinate(const GeoCoordinate &geo);

  /**
   * Projects the reference point, runs the measurement session, applies grid
   * convergence and composes the transform. Never throws: every outcome is
   * one of GeoreferenceResult, Cancelled or Failure.
   */
  class GeoreferencingOrchestrator
  {
  public:
    GeoreferencingOrchestrator(CrsProjector &projector, SessionIo io, RunLog &log,
                               bool apply_grid_convergence = true);

    GeoreferenceOutcome run(const GeoCoordinate &reference, const std::string &target_crs);

  private:
    GeoreferenceOutcome run_unchecked(const GeoCoordinate &reference, const std::string &target_crs);

    CrsProjector &projector_;
    SessionIo io_;
    RunLog &log_;
    bool apply_grid_convergence_;
  };

}
