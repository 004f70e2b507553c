#include "measurement_session.hpp"
#include "config.hpp"
#include "parsing.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cavegeo
{

  namespace
  {
    constexpr double RAD_TO_DEG = 180.0 / 3.14159265358979323846;

    bool is_skip_north_key(int key)
    {
      return key == Config::KEY_SKIP_NORTH_LOWER || key == Config::KEY_SKIP_NORTH_UPPER;
    }
  }

  const char *session_state_name(SessionState state)
  {
    switch (state)
    {
    case SessionState::AwaitingReference:
      return "AwaitingReference";
    case SessionState::AwaitingScale:
      return "AwaitingScale";
    case SessionState::AwaitingOrientation:
      return "AwaitingOrientation";
    case SessionState::AwaitingDeclination:
      return "AwaitingDeclination";
    case SessionState::Complete:
      return "Complete";
    case SessionState::Cancelled:
      return "Cancelled";
    }
    return "Unknown";
  }

  double pixel_distance(const PixelPoint &p1, const PixelPoint &p2)
  {
    return std::hypot(static_cast<double>(p2.x - p1.x), static_cast<double>(p2.y - p1.y));
  }

  double orientation_angle_deg(const OrientationMeasurement &orientation)
  {
    const auto *measured = std::get_if<NorthMeasured>(&orientation);
    if (!measured)
      return 0.0;
    double dx = measured->tip.x - measured->base.x;
    double dy = measured->tip.y - measured->base.y;
    // Image y grows down, so "up" is -y; atan2(dx, -dy) is clockwise from up.
    return std::atan2(dx, -dy) * RAD_TO_DEG;
  }

  MeasurementSession::MeasurementSession(InputEventSource &events, TextPrompt &prompt,
                                         MeasurementView &view, RunLog &log)
      : events_(events), prompt_(prompt), view_(view), log_(log) {}

  SessionOutcome MeasurementSession::run()
  {
    if (state_ != SessionState::AwaitingReference)
      throw std::logic_error("measurement session already ran");

    ViewLease lease(view_);
    auto cancel = [this]()
    {
      SessionState at = state_;
      state_ = SessionState::Cancelled;
      log_.info("Measurement cancelled by user during ", session_state_name(at));
      return SessionOutcome{SessionCancelled{at}};
    };

    if (!capture_reference())
      return cancel();
    advance(SessionState::AwaitingScale);
    if (!capture_scale())
      return cancel();
    advance(SessionState::AwaitingOrientation);
    if (!capture_orientation())
      return cancel();
    advance(SessionState::AwaitingDeclination);
    if (!capture_declination())
      return cancel();
    advance(SessionState::Complete);
    return captured_;
  }

  void MeasurementSession::advance(SessionState next)
  {
    // Clicks queued during the previous step must not leak into the next one.
    events_.discard_pending();
    state_ = next;
  }

  bool MeasurementSession::capture_reference()
  {
    log_.console() << "\n--- STEP 1: MARK CAVE ENTRANCE ---\n"
                   << "Click on the image to mark the point. Press SPACE or ENTER to confirm.\n";
    std::optional<PixelPoint> point;
    while (true)
    {
      InputEvent event = events_.next_event();
      if (std::holds_alternative<CancelEvent>(event))
        return false;
      if (const auto *click = std::get_if<ClickEvent>(&event))
      {
        point = click->point;
        view_.clear();
        view_.show_reference(*point);
      }
      else if (std::holds_alternative<ConfirmEvent>(event))
      {
        if (point.has_value())
          break;
        log_.console() << "Please mark a point first.\n";
      }
    }
    captured_.reference = *point;
    log_.info("Entrance marked at: (", point->x, ", ", point->y, ")");
    return true;
  }

  bool MeasurementSession::read_scale_points(PixelPoint &start, PixelPoint &end)
  {
    while (true)
    {
      std::vector<PixelPoint> points;
      while (points.size() < 2)
      {
        InputEvent event = events_.next_event();
        if (std::holds_alternative<CancelEvent>(event))
          return false;
        if (const auto *click = std::get_if<ClickEvent>(&event))
        {
          points.push_back(click->point);
          view_.clear();
          view_.show_scale(points);
        }
      }
      if (points[0] != points[1])
      {
        start = points[0];
        end = points[1];
        return true;
      }
      log_.warn("Scale points cannot be the same. Mark the scale bar again.");
      view_.clear();
    }
  }

  bool MeasurementSession::capture_scale()
  {
    log_.console() << "\n--- STEP 2: MARK SCALE BAR ---\n"
                   << "Click Start point, then click End point of the scale bar.\n";
    PixelPoint start, end;
    if (!read_scale_points(start, end))
      return false;
    double pixels = pixel_distance(start, end);
    log_.info("Scale bar length in pixels: ", std::fixed, std::setprecision(2), pixels);

    std::ostringstream question;
    question << "Enter the real-world length of this line in METERS [pixels="
             << std::fixed << std::setprecision(1) << pixels << "]: ";
    double meters = 0.0;
    while (true)
    {
      auto answer = prompt_.ask(question.str());
      if (!answer.has_value())
        return false;
      auto value = parse_number(*answer);
      if (!value.has_value())
      {
        log_.console() << "Invalid input. Please enter a number.\n";
        continue;
      }
      if (*value <= 0.0)
      {
        log_.console() << "Distance must be positive.\n";
        continue;
      }
      meters = *value;
      break;
    }

    captured_.scale = ScaleMeasurement{start, end, meters};
    log_.info("Calculated scale: ", std::fixed, std::setprecision(4), pixels / meters, " pixels/meter");
    return true;
  }

  bool MeasurementSession::capture_orientation()
  {
    log_.console() << "\n--- STEP 3: MARK NORTH DIRECTION ---\n"
                   << "Option 1: Click base of arrow, then tip of arrow pointing North.\n"
                   << "Option 2: Press 'S' if North is straight UP on the image.\n";
    std::vector<PixelPoint> points;
    while (true)
    {
      InputEvent event = events_.next_event();
      if (std::holds_alternative<CancelEvent>(event))
        return false;
      if (const auto *key = std::get_if<KeyEvent>(&event))
      {
        if (!is_skip_north_key(key->key))
          continue;
        captured_.orientation = NorthSkipped{};
        log_.info("North marking skipped. Defaulting to North = UP (0 degrees).");
        return true;
      }
      const auto *click = std::get_if<ClickEvent>(&event);
      if (!click)
        continue;
      points.push_back(click->point);
      view_.clear();
      view_.show_north(points);
      if (points.size() < 2)
        continue;
      if (points[0] == points[1])
      {
        log_.warn("North arrow base and tip coincide. Mark the arrow again.");
        points.clear();
        view_.clear();
        continue;
      }
      captured_.orientation = NorthMeasured{points[0], points[1]};
      log_.info("Calculated North angle from top: ", std::fixed, std::setprecision(2),
                orientation_angle_deg(captured_.orientation), " degrees");
      return true;
    }
  }

  bool MeasurementSession::capture_declination()
  {
    log_.console() << "\n--- STEP 4: MAGNETIC / MANUAL DECLINATION CORRECTION ---\n";
    auto answer = prompt_.ask("Enter additional declination correction in degrees "
                              "(usually 0 for plans already in geographic north; "
                              "positive if the arrow is still magnetic): ");
    if (!answer.has_value())
      return false;
    std::string text = trim(*answer);
    double declination = 0.0;
    if (!text.empty())
    {
      auto value = parse_number(text);
      if (value.has_value())
        declination = *value;
      else
        log_.warn("Invalid declination input: '", text, "'. Defaulting to 0.0.");
    }
    captured_.declination_deg = declination;
    log_.info("Additional (manual) declination used: ", declination);
    return true;
  }

}
