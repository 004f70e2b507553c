#pragma once

#include "types.hpp"
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace cavegeo
{

  struct ClickEvent
  {
    PixelPoint point;
  };

  /** SPACE or ENTER. */
  struct ConfirmEvent
  {
  };

  /** ESC, or the display surface went away. */
  struct CancelEvent
  {
  };

  /** Any other key press. */
  struct KeyEvent
  {
    int key = 0;
  };

  using InputEvent = std::variant<ClickEvent, ConfirmEvent, CancelEvent, KeyEvent>;

  /** Blocking source of pointer and keyboard events. */
  class InputEventSource
  {
  public:
    virtual ~InputEventSource() = default;
    virtual InputEvent next_event() = 0;
    /** Drops events that arrived but were not read yet. Called when a step ends. */
    virtual void discard_pending() = 0;
  };

  /** Line-oriented text input. nullopt means the input is closed. */
  class TextPrompt
  {
  public:
    virtual ~TextPrompt() = default;
    virtual std::optional<std::string> ask(const std::string &question) = 0;
  };

  class StreamPrompt : public TextPrompt
  {
  public:
    StreamPrompt(std::istream &in, std::ostream &out);
    std::optional<std::string> ask(const std::string &question) override;

  private:
    std::istream &in_;
    std::ostream &out_;
  };

  /** Visual feedback for the measurement being captured. */
  class MeasurementView
  {
  public:
    virtual ~MeasurementView() = default;
    virtual void open() = 0;
    virtual void close() = 0;
    /** Drops all markers. */
    virtual void clear() = 0;
    virtual void show_reference(const PixelPoint &point) = 0;
    virtual void show_scale(const std::vector<PixelPoint> &points) = 0;
    virtual void show_north(const std::vector<PixelPoint> &points) = 0;
  };

  /** Keeps a view open for the lifetime of the lease. */
  class ViewLease
  {
  public:
    explicit ViewLease(MeasurementView &view) : view_(view) { view_.open(); }
    ~ViewLease() { view_.close(); }
    ViewLease(const ViewLease &) = delete;
    ViewLease &operator=(const ViewLease &) = delete;

  private:
    MeasurementView &view_;
  };

}
