#pragma once

#include "input_events.hpp"
#include "run_log.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace cavegeo
{

  enum class SessionState
  {
    AwaitingReference,
    AwaitingScale,
    AwaitingOrientation,
    AwaitingDeclination,
    Complete,
    Cancelled
  };

  const char *session_state_name(SessionState state);

  struct SessionCancelled
  {
    SessionState at;
  };

  using SessionOutcome = std::variant<PlanMeasurements, SessionCancelled>;

  double pixel_distance(const PixelPoint &p1, const PixelPoint &p2);

  /** Clockwise angle in degrees from image "up" to the measured arrow; 0 when skipped. */
  double orientation_angle_deg(const OrientationMeasurement &orientation);

  /**
   * Four-step capture of the manual measurements on a plan image:
   * reference pixel, scale bar, north direction, declination.
   * Single use: run() drives the whole session once.
   */
  class MeasurementSession
  {
  public:
    MeasurementSession(InputEventSource &events, TextPrompt &prompt, MeasurementView &view, RunLog &log);

    SessionOutcome run();
    SessionState state() const { return state_; }

  private:
    bool capture_reference();
    bool capture_scale();
    bool capture_orientation();
    bool capture_declination();
    bool read_scale_points(PixelPoint &start, PixelPoint &end);
    void advance(SessionState next);

    InputEventSource &events_;
    TextPrompt &prompt_;
    MeasurementView &view_;
    RunLog &log_;

    SessionState state_ = SessionState::AwaitingReference;
    PlanMeasurements captured_;
  };

}
