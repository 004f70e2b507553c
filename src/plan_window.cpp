#include "plan_window.hpp"
#include "config.hpp"
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace cavegeo
{

  namespace
  {
    cv::Scalar bgr(const int (&color)[3])
    {
      return cv::Scalar(color[0], color[1], color[2]);
    }
  }

  PlanWindow::PlanWindow(const cv::Mat &plan_bgr, std::string window_name)
      : base_(plan_bgr.clone()),
        window_name_(window_name.empty() ? Config::WINDOW_NAME : std::move(window_name))
  {
    base_.copyTo(display_);
  }

  PlanWindow::~PlanWindow()
  {
    close();
  }

  void PlanWindow::open()
  {
    if (open_)
      return;
    cv::namedWindow(window_name_, cv::WINDOW_NORMAL);
    if (base_.cols > Config::MAX_DISPLAY_WIDTH_PX)
    {
      double scale = static_cast<double>(Config::MAX_DISPLAY_WIDTH_PX) / base_.cols;
      cv::resizeWindow(window_name_, Config::MAX_DISPLAY_WIDTH_PX, static_cast<int>(base_.rows * scale));
    }
    cv::setMouseCallback(window_name_, &PlanWindow::on_mouse, this);
    open_ = true;
    pending_clicks_.clear();
    clear();
  }

  void PlanWindow::close()
  {
    if (!open_)
      return;
    open_ = false;
    cv::setMouseCallback(window_name_, nullptr, nullptr);
    cv::destroyWindow(window_name_);
    cv::waitKey(1);
  }

  void PlanWindow::on_mouse(int event, int x, int y, int /*flags*/, void *userdata)
  {
    if (event != cv::EVENT_LBUTTONDOWN || !userdata)
      return;
    static_cast<PlanWindow *>(userdata)->pending_clicks_.emplace_back(x, y);
  }

  bool PlanWindow::is_visible() const
  {
    return cv::getWindowProperty(window_name_, cv::WND_PROP_VISIBLE) >= 1.0;
  }

  InputEvent PlanWindow::next_event()
  {
    if (!open_)
      return CancelEvent{};
    while (true)
    {
      if (!pending_clicks_.empty())
      {
        PixelPoint p = pending_clicks_.front();
        pending_clicks_.pop_front();
        return ClickEvent{p};
      }
      int key = cv::waitKey(Config::EVENT_POLL_MS);
      if (key >= 0)
      {
        key &= 0xFF;
        if (key == Config::KEY_ESCAPE)
          return CancelEvent{};
        if (key == Config::KEY_ENTER || key == Config::KEY_LINE_FEED || key == Config::KEY_SPACE)
          return ConfirmEvent{};
        return KeyEvent{key};
      }
      if (!is_visible())
        return CancelEvent{};
    }
  }

  void PlanWindow::discard_pending()
  {
    pending_clicks_.clear();
  }

  void PlanWindow::refresh()
  {
    if (open_)
      cv::imshow(window_name_, display_);
  }

  void PlanWindow::clear()
  {
    base_.copyTo(display_);
    refresh();
  }

  void PlanWindow::show_reference(const PixelPoint &point)
  {
    cv::circle(display_, point, Config::MARKER_DOT_RADIUS_PX, bgr(Config::REFERENCE_COLOR_BGR), -1);
    cv::circle(display_, point, Config::MARKER_RING_RADIUS_PX, bgr(Config::REFERENCE_COLOR_BGR), 2);
    refresh();
  }

  void PlanWindow::show_scale(const std::vector<PixelPoint> &points)
  {
    for (const auto &p : points)
      cv::circle(display_, p, Config::MARKER_DOT_RADIUS_PX, bgr(Config::SCALE_COLOR_BGR), -1);
    if (points.size() >= 2)
      cv::line(display_, points[0], points[1], bgr(Config::SCALE_COLOR_BGR), 2);
    refresh();
  }

  void PlanWindow::show_north(const std::vector<PixelPoint> &points)
  {
    if (!points.empty())
      cv::circle(display_, points[0], Config::MARKER_DOT_RADIUS_PX, bgr(Config::NORTH_COLOR_BGR), -1);
    if (points.size() >= 2)
      cv::arrowedLine(display_, points[0], points[1], bgr(Config::NORTH_COLOR_BGR), 3, cv::LINE_8, 0,
                      Config::ARROW_TIP_LENGTH);
    refresh();
  }

}
