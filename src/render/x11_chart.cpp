#include "render/x11_chart.hpp"

#include <X11/Xutil.h>
#include <X11/keysym.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace kth_logger::render {
namespace {

constexpr const char* kWindowTitle = "Elmor Labs KTH-USB";
constexpr const char* kAxesTitle = "Temperature";
constexpr const char* kYLabel = "Temperature [Celsius]";

// ggplot palette.
constexpr std::array<const char*, 7> kSeriesColors = {
    "#E24A33", "#348ABD", "#988ED5", "#777777", "#FBC15E", "#8EBA42", "#FFB5B8",
};

constexpr int kMarginLeft = 72;
constexpr int kMarginRight = 24;
constexpr int kMarginTop = 64;
constexpr int kMarginBottom = 40;
constexpr int kTickLength = 4;

}  // namespace

X11ChartRenderer::X11ChartRenderer(const core::RenderConfig& config)
    : width_(static_cast<int>(config.width)), height_(static_cast<int>(config.height)) {
  display_ = XOpenDisplay(nullptr);
  if (display_ == nullptr) {
    throw std::runtime_error("cannot open X display; set DISPLAY or run with render.enabled: false");
  }

  const int screen = DefaultScreen(display_);
  window_ = XCreateSimpleWindow(display_, RootWindow(display_, screen), 10, 10, static_cast<unsigned>(width_),
                                static_cast<unsigned>(height_), 0, BlackPixel(display_, screen),
                                BlackPixel(display_, screen));
  XStoreName(display_, window_, kWindowTitle);

  wm_delete_window_ = XInternAtom(display_, "WM_DELETE_WINDOW", False);
  XSetWMProtocols(display_, window_, &wm_delete_window_, 1);
  XSelectInput(display_, window_, ExposureMask | KeyPressMask | StructureNotifyMask);

  gc_ = XCreateGC(display_, window_, 0, nullptr);

  regular_font_ = XLoadQueryFont(display_, "-*-helvetica-medium-r-*-*-12-*-*-*-*-*-*-*");
  if (regular_font_ == nullptr) {
    regular_font_ = XLoadQueryFont(display_, "fixed");
  }
  title_font_ = XLoadQueryFont(display_, "-*-helvetica-bold-r-*-*-18-*-*-*-*-*-*-*");
  if (title_font_ == nullptr) {
    title_font_ = XLoadQueryFont(display_, "9x15bold");
  }
  if (regular_font_ == nullptr) {
    std::cerr << "[render] no usable X font found; labels disabled\n";
  }

  allocate_colors();
  recreate_back_buffer();
  XMapWindow(display_, window_);
  XFlush(display_);
}

X11ChartRenderer::~X11ChartRenderer() {
  if (display_ == nullptr) {
    return;
  }
  if (title_font_ != nullptr) {
    XFreeFont(display_, title_font_);
  }
  if (regular_font_ != nullptr) {
    XFreeFont(display_, regular_font_);
  }
  if (back_buffer_ != 0) {
    XFreePixmap(display_, back_buffer_);
  }
  if (gc_ != nullptr) {
    XFreeGC(display_, gc_);
  }
  if (window_ != 0) {
    XDestroyWindow(display_, window_);
  }
  XCloseDisplay(display_);
}

unsigned long X11ChartRenderer::color(const char* spec, const unsigned long fallback) {
  const Colormap colormap = DefaultColormap(display_, DefaultScreen(display_));
  XColor parsed{};
  if (XParseColor(display_, colormap, spec, &parsed) != 0 && XAllocColor(display_, colormap, &parsed) != 0) {
    return parsed.pixel;
  }
  return fallback;
}

void X11ChartRenderer::allocate_colors() {
  const int screen = DefaultScreen(display_);
  const unsigned long black = BlackPixel(display_, screen);
  const unsigned long white = WhitePixel(display_, screen);

  figure_bg_ = color("#707576", black);
  axes_bg_ = color("#E5E5E5", white);
  grid_color_ = color("#FFFFFF", white);
  text_color_ = color("#000000", black);
  legend_bg_ = color("#F2F2F2", white);
  for (std::size_t i = 0; i < kSeriesColors.size(); ++i) {
    series_colors_[i] = color(kSeriesColors[i], black);
  }
}

void X11ChartRenderer::recreate_back_buffer() {
  if (back_buffer_ != 0) {
    XFreePixmap(display_, back_buffer_);
  }
  back_buffer_ = XCreatePixmap(display_, window_, static_cast<unsigned>(width_), static_cast<unsigned>(height_),
                               static_cast<unsigned>(DefaultDepth(display_, DefaultScreen(display_))));
}

bool X11ChartRenderer::process_events() {
  while (!closed_ && XPending(display_) > 0) {
    XEvent event{};
    XNextEvent(display_, &event);
    switch (event.type) {
      case ConfigureNotify:
        if (event.xconfigure.width != width_ || event.xconfigure.height != height_) {
          width_ = std::max(event.xconfigure.width, 1);
          height_ = std::max(event.xconfigure.height, 1);
          recreate_back_buffer();
          render();
        }
        break;
      case Expose:
        if (event.xexpose.count == 0) {
          present();
        }
        break;
      case KeyPress: {
        const KeySym key = XLookupKeysym(&event.xkey, 0);
        if (key == XK_q || key == XK_Escape) {
          closed_ = true;
        }
        break;
      }
      case ClientMessage:
        if (static_cast<Atom>(event.xclient.data.l[0]) == wm_delete_window_) {
          closed_ = true;
        }
        break;
      default:
        break;
    }
  }
  return !closed_;
}

void X11ChartRenderer::present() {
  XCopyArea(display_, back_buffer_, window_, gc_, 0, 0, static_cast<unsigned>(width_), static_cast<unsigned>(height_),
            0, 0);
  XFlush(display_);
}

int X11ChartRenderer::text_width(const std::string& text, XFontStruct* font) const {
  if (font == nullptr) {
    return 0;
  }
  return XTextWidth(font, text.c_str(), static_cast<int>(text.size()));
}

void X11ChartRenderer::draw_text(const int x, const int y, const std::string& text, XFontStruct* font,
                                 const unsigned long fg) {
  if (font == nullptr) {
    return;
  }
  XSetFont(display_, gc_, font->fid);
  XSetForeground(display_, gc_, fg);
  XDrawString(display_, back_buffer_, gc_, x, y, text.c_str(), static_cast<int>(text.size()));
}

void X11ChartRenderer::draw(const std::vector<model::Reading>& rows) {
  last_rows_ = rows;
  render();
}

void X11ChartRenderer::render() {
  const auto series = pivot_temperature_series(last_rows_);
  const auto layout = compute_layout(series);

  const Viewport plot{kMarginLeft, kMarginTop, std::max(width_ - kMarginLeft - kMarginRight, 1),
                      std::max(height_ - kMarginTop - kMarginBottom, 1)};

  XSetForeground(display_, gc_, figure_bg_);
  XFillRectangle(display_, back_buffer_, gc_, 0, 0, static_cast<unsigned>(width_), static_cast<unsigned>(height_));

  draw_text((width_ - text_width(kWindowTitle, title_font_)) / 2, 24, kWindowTitle, title_font_, text_color_);
  draw_text(plot.left + ((plot.width - text_width(kAxesTitle, regular_font_)) / 2), plot.top - 8, kAxesTitle,
            regular_font_, text_color_);

  draw_axes(layout, plot);
  draw_series(series, layout, plot);
  draw_legend(series, plot);
  present();
}

void X11ChartRenderer::draw_axes(const ChartLayout& layout, const Viewport& plot) {
  XSetForeground(display_, gc_, axes_bg_);
  XFillRectangle(display_, back_buffer_, gc_, plot.left, plot.top, static_cast<unsigned>(plot.width),
                 static_cast<unsigned>(plot.height));

  // No spines, only grid lines and tick labels.
  XSetLineAttributes(display_, gc_, 1, LineSolid, CapButt, JoinMiter);
  for (const auto& tick : layout.y_ticks) {
    const auto pixel = project(layout, plot, layout.t_min_us, tick.position);
    XSetForeground(display_, gc_, grid_color_);
    XDrawLine(display_, back_buffer_, gc_, plot.left, pixel.y, plot.left + plot.width, pixel.y);
    draw_text(plot.left - kTickLength - 4 - text_width(tick.label, regular_font_), pixel.y + 4, tick.label,
              regular_font_, text_color_);
  }
  for (const auto& tick : layout.x_ticks) {
    const auto pixel = project(layout, plot, static_cast<std::int64_t>(tick.position), layout.y_min);
    XSetForeground(display_, gc_, grid_color_);
    XDrawLine(display_, back_buffer_, gc_, pixel.x, plot.top, pixel.x, plot.top + plot.height);
    draw_text(pixel.x - (text_width(tick.label, regular_font_) / 2), plot.top + plot.height + 16, tick.label,
              regular_font_, text_color_);
  }

  // Xlib cannot rotate text; stack the y label one glyph per line.
  if (regular_font_ != nullptr) {
    const int line_height = regular_font_->ascent + regular_font_->descent;
    const int label_height = line_height * static_cast<int>(std::strlen(kYLabel));
    int y = plot.top + ((plot.height - label_height) / 2) + regular_font_->ascent;
    for (const char glyph : std::string(kYLabel)) {
      const std::string text(1, glyph);
      draw_text(12 - (text_width(text, regular_font_) / 2) + 4, y, text, regular_font_, text_color_);
      y += line_height;
    }
  }
}

void X11ChartRenderer::draw_series(const std::vector<Series>& series, const ChartLayout& layout,
                                   const Viewport& plot) {
  XSetLineAttributes(display_, gc_, 2, LineSolid, CapRound, JoinRound);
  for (std::size_t index = 0; index < series.size(); ++index) {
    const auto& item = series[index];
    if (item.points.empty()) {
      continue;
    }

    std::vector<XPoint> points;
    points.reserve(item.points.size());
    for (const auto& point : item.points) {
      const auto pixel = project(layout, plot, point.timestamp_us, point.value);
      points.push_back(XPoint{static_cast<short>(pixel.x), static_cast<short>(pixel.y)});
    }

    XSetForeground(display_, gc_, series_colors_[index % series_colors_.size()]);
    if (points.size() == 1) {
      XFillArc(display_, back_buffer_, gc_, points.front().x - 2, points.front().y - 2, 5, 5, 0, 360 * 64);
    } else {
      XDrawLines(display_, back_buffer_, gc_, points.data(), static_cast<int>(points.size()), CoordModeOrigin);
    }
  }
  XSetLineAttributes(display_, gc_, 1, LineSolid, CapButt, JoinMiter);
}

void X11ChartRenderer::draw_legend(const std::vector<Series>& series, const Viewport& plot) {
  if (series.empty() || regular_font_ == nullptr) {
    return;
  }

  constexpr int kSwatch = 20;
  constexpr int kPadding = 6;
  const int line_height = regular_font_->ascent + regular_font_->descent + 4;
  int label_width = 0;
  for (const auto& item : series) {
    label_width = std::max(label_width, text_width(item.sensor_id, regular_font_));
  }

  const int box_width = kPadding + kSwatch + kPadding + label_width + kPadding;
  const int box_height = (kPadding * 2) + (line_height * static_cast<int>(series.size()));
  const int box_x = plot.left + plot.width - box_width - 8;
  const int box_y = plot.top + ((plot.height - box_height) / 2);

  XSetForeground(display_, gc_, legend_bg_);
  XFillRectangle(display_, back_buffer_, gc_, box_x, box_y, static_cast<unsigned>(box_width),
                 static_cast<unsigned>(box_height));

  XSetLineAttributes(display_, gc_, 2, LineSolid, CapButt, JoinMiter);
  for (std::size_t index = 0; index < series.size(); ++index) {
    const int row_y = box_y + kPadding + (line_height * static_cast<int>(index));
    const int mid_y = row_y + (line_height / 2);
    XSetForeground(display_, gc_, series_colors_[index % series_colors_.size()]);
    XDrawLine(display_, back_buffer_, gc_, box_x + kPadding, mid_y, box_x + kPadding + kSwatch, mid_y);
    draw_text(box_x + kPadding + kSwatch + kPadding, row_y + regular_font_->ascent + 2, series[index].sensor_id,
              regular_font_, text_color_);
  }
  XSetLineAttributes(display_, gc_, 1, LineSolid, CapButt, JoinMiter);
}

}  // namespace kth_logger::render
