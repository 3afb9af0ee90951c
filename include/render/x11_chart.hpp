#pragma once

#include <array>
#include <string>
#include <vector>

#include <X11/Xlib.h>

#include "core/config.hpp"
#include "model/reading.hpp"
#include "render/chart_model.hpp"

namespace kth_logger::render {

// Live temperature chart in its own X11 window. Owns the display connection,
// the window and its back buffer; one instance per run.
class X11ChartRenderer {
 public:
  explicit X11ChartRenderer(const core::RenderConfig& config);
  ~X11ChartRenderer();

  X11ChartRenderer(const X11ChartRenderer&) = delete;
  X11ChartRenderer& operator=(const X11ChartRenderer&) = delete;
  X11ChartRenderer(X11ChartRenderer&&) = delete;
  X11ChartRenderer& operator=(X11ChartRenderer&&) = delete;

  // Drains pending window events. Returns false once the window was closed.
  bool process_events();

  // Clears and redraws the whole figure from a buffer snapshot.
  void draw(const std::vector<model::Reading>& rows);

 private:
  void allocate_colors();
  void recreate_back_buffer();
  void render();
  void present();
  unsigned long color(const char* spec, unsigned long fallback);
  void draw_text(int x, int y, const std::string& text, XFontStruct* font, unsigned long fg);
  int text_width(const std::string& text, XFontStruct* font) const;
  void draw_axes(const ChartLayout& layout, const Viewport& plot);
  void draw_series(const std::vector<Series>& series, const ChartLayout& layout, const Viewport& plot);
  void draw_legend(const std::vector<Series>& series, const Viewport& plot);

  Display* display_{nullptr};
  Window window_{0};
  GC gc_{nullptr};
  Pixmap back_buffer_{0};
  Atom wm_delete_window_{0};
  XFontStruct* regular_font_{nullptr};
  XFontStruct* title_font_{nullptr};
  int width_;
  int height_;
  bool closed_{false};
  std::vector<model::Reading> last_rows_{};

  unsigned long figure_bg_{0};
  unsigned long axes_bg_{0};
  unsigned long grid_color_{0};
  unsigned long text_color_{0};
  unsigned long legend_bg_{0};
  std::array<unsigned long, 7> series_colors_{};
};

}  // namespace kth_logger::render
