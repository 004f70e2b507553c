#pragma once

#include "input_events.hpp"
#include <opencv2/core.hpp>
#include <deque>
#include <string>
#include <vector>

namespace cavegeo
{

  /**
   * OpenCV highgui window showing the plan. Feeds clicks and key presses to the
   * measurement session and draws its markers. The window exists between open() and close().
   */
  class PlanWindow : public InputEventSource, public MeasurementView
  {
  public:
    explicit PlanWindow(const cv::Mat &plan_bgr, std::string window_name = "");
    ~PlanWindow() override;

    InputEvent next_event() override;
    void discard_pending() override;

    void open() override;
    void close() override;
    void clear() override;
    void show_reference(const PixelPoint &point) override;
    void show_scale(const std::vector<PixelPoint> &points) override;
    void show_north(const std::vector<PixelPoint> &points) override;

  private:
    static void on_mouse(int event, int x, int y, int flags, void *userdata);
    void refresh();
    bool is_visible() const;

    cv::Mat base_;
    cv::Mat display_;
    std::string window_name_;
    std::deque<PixelPoint> pending_clicks_;
    bool open_ = false;
  };

}
