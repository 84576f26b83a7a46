#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include <f1ta/viewer/app.hpp>
#include <f1ta/controller.hpp>
#include <f1ta/report.hpp>

namespace f1ta {

namespace {

static Color toColor(const Rgb& c, unsigned char a = 255) {
  return Color{c.r, c.g, c.b, a};
}

// --- Layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y    = 20;  // size 20
static constexpr int kHUD_LINE2_Y    = 46;  // size 18
static constexpr int kHUD_LINE3_Y    = 72;  // size 14
static constexpr int kHUD_BOTTOM_PAD = 24;
static constexpr float kPanelPad     = 12.0f;

static const Color kPanelBg    = Color{24, 24, 28, 220};
static const Color kAxis       = Color{60, 60, 70, 255};
static const Color kText       = Color{200, 200, 210, 255};
static const Color kCoast      = Color{241, 196, 15, 70};   // yellow wash
static const Color kTraction   = Color{231, 76, 60, 90};    // red wash
static const Color kFastest    = Color{180, 90, 255, 255};  // purple

static void draw_panel(float x, float y, float w, float h, const char* title) {
  DrawRectangle(int(x) - 6, int(y) - 6, int(w) + 12, int(h) + 12, Color{0, 0, 0, 80});
  DrawRectangle(int(x), int(y), int(w), int(h), kPanelBg);
  DrawText(title, int(x + kPanelPad), int(y + 6), 16, kText);
}

static void draw_unavailable(float x, float y, Unavailable why) {
  DrawText(TextFormat("n/a (%s)", unavailable_name(why)), int(x), int(y), 16, Color{150, 150, 160, 255});
}

// Maps a data range onto a pixel span; degenerate ranges map to the middle.
struct Axis {
  double lo = 0.0, hi = 1.0;
  float  p0 = 0.0f, p1 = 1.0f;
  float map(double v) const {
    if (hi - lo <= 0.0) return 0.5f * (p0 + p1);
    return p0 + float((v - lo) / (hi - lo)) * (p1 - p0);
  }
};

} // namespace

// ---- DashboardApp ----

DashboardApp::DashboardApp(AnalysisController& ctl) : ctl_(ctl) {
  select_(0);
}

void DashboardApp::select_(std::size_t roster_index) {
  const auto& ctx = ctl_.context();
  if (!ctx || ctx->roster.empty()) { analysis_ = unavailable_analysis(Unavailable::ProviderError); return; }
  roster_idx_ = roster_index % ctx->roster.size();
  if (auto ds = ctl_.select_driver(ctx->roster[roster_idx_].id, roster_idx_); ds) {
    analysis_ = ctl_.analyze();
  } else {
    // every panel shows why the driver has nothing to draw
    analysis_ = unavailable_analysis(ds.reason());
    analysis_.driver = ctx->roster[roster_idx_];
  }
}

int DashboardApp::run() {
  const int W = 1280, H = 820;
  InitWindow(W, H, "F1TA - Telemetry Dashboard");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void DashboardApp::process_input_() {
  const auto& ctx = ctl_.context();
  const std::size_t n = ctx ? ctx->roster.size() : 0;
  if (n == 0) return;
  if (IsKeyPressed(KEY_RIGHT)) select_(roster_idx_ + 1);
  if (IsKeyPressed(KEY_LEFT))  select_(roster_idx_ + n - 1);
  if (IsKeyPressed(KEY_C)) show_coast_ = !show_coast_;
  if (IsKeyPressed(KEY_T)) show_traction_ = !show_traction_;
}

void DashboardApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18, 18, 22, 255});

  const float W = float(GetScreenWidth());
  const float H = float(GetScreenHeight());
  const float top = float(kHUD_LINE3_Y + 14 + kHUD_BOTTOM_PAD);
  const float gap = 18.0f;
  const float left_w = (W - 3 * gap) * 0.66f;
  const float right_w = W - 3 * gap - left_w;
  const float upper_h = (H - top - 2 * gap) * 0.55f;
  const float lower_h = H - top - 2 * gap - upper_h;

  draw_speed_trace_(gap, top, left_w, upper_h);
  draw_circuit_(2 * gap + left_w, top, right_w, upper_h);
  draw_lap_evolution_(gap, top + upper_h + gap, left_w, lower_h);
  draw_stints_(2 * gap + left_w, top + upper_h + gap, right_w, lower_h);

  draw_hud_();
  EndDrawing();
}

void DashboardApp::draw_hud_() {
  const auto& ctx = ctl_.context();
  const std::string session = ctx ? session_label(ctx->key) : std::string("no session loaded");
  const std::string driver = analysis_.driver.id.empty() ? std::string("--") : driver_label(analysis_.driver);

  DrawText(TextFormat("%s  |  %s", session.c_str(), driver.c_str()),
           20, kHUD_LINE1_Y, 20, Color{220, 235, 220, 255});

  DrawText(TextFormat("full throttle %s   coast %s   traction loss %s",
                      fmt_percent(analysis_.efficiency).c_str(),
                      fmt_percent(analysis_.coast_pct).c_str(),
                      fmt_percent(analysis_.traction_pct).c_str()),
           20, kHUD_LINE2_Y, 18, Color{235, 220, 220, 255});

  DrawText("Left/Right: Driver | C: Coast zones | T: Traction zones | Esc: Quit",
           20, kHUD_LINE3_Y, 14, Color{190, 205, 190, 255});
}

void DashboardApp::draw_speed_trace_(float x, float y, float w, float h) {
  draw_panel(x, y, w, h, "Speed (km/h) vs distance (m), fastest lap");
  const auto& ds = ctl_.dataset();
  if (!ds || !ds->fastest_telemetry || ds->fastest_telemetry->size() < 2 ||
      !has_channel(*ds->fastest_telemetry, Channel::Speed)) {
    draw_unavailable(x + kPanelPad, y + 32, ds ? Unavailable::MissingData : Unavailable::ProviderError);
    return;
  }
  const auto& t = *ds->fastest_telemetry;

  double vmax = 0.0;
  for (const auto& s : t) vmax = std::max(vmax, *s.speed);
  Axis ax{t.front().distance, t.back().distance, x + kPanelPad, x + w - kPanelPad};
  Axis ay{0.0, std::max(1.0, vmax * 1.05), y + h - kPanelPad, y + 30.0f};

  // Event washes under the trace
  auto wash = [&](const Outcome<std::vector<EventSegment>>& segs, Color c) {
    if (!segs) return;
    for (const auto& seg : *segs) {
      const float a = ax.map(seg.start_m);
      const float b = std::max(ax.map(seg.end_m), a + 1.0f);
      DrawRectangle(int(a), int(ay.p1), int(b - a), int(ay.p0 - ay.p1), c);
    }
  };
  if (show_coast_) wash(analysis_.coast_segments, kCoast);
  if (show_traction_) wash(analysis_.traction_segments, kTraction);

  // Corner markers
  for (const auto& c : ds->context->corners) {
    if (c.distance < ax.lo || c.distance > ax.hi) continue;
    const float px = ax.map(c.distance);
    for (float yy = ay.p1; yy < ay.p0; yy += 8.0f) {
      DrawLine(int(px), int(yy), int(px), int(std::min(yy + 4.0f, ay.p0)), kAxis);
    }
    DrawText(TextFormat("T%d", c.number), int(px) + 2, int(ay.p1), 10, kText);
  }

  const Color col = toColor(ds->color);
  for (std::size_t i = 1; i < t.size(); ++i) {
    DrawLineEx({ax.map(t[i - 1].distance), ay.map(*t[i - 1].speed)},
               {ax.map(t[i].distance),     ay.map(*t[i].speed)}, 2.0f, col);
  }
}

void DashboardApp::draw_circuit_(float x, float y, float w, float h) {
  draw_panel(x, y, w, h, "Circuit (coast / traction)");
  const auto& ds = ctl_.dataset();
  if (!ds || !ds->fastest_telemetry) {
    draw_unavailable(x + kPanelPad, y + 32, ds ? Unavailable::MissingData : Unavailable::ProviderError);
    return;
  }
  const auto& t = *ds->fastest_telemetry;

  double xmin = std::numeric_limits<double>::max(), xmax = std::numeric_limits<double>::lowest();
  double ymin = xmin, ymax = xmax;
  std::size_t with_pos = 0;
  for (const auto& s : t) {
    if (!s.pos) continue;
    ++with_pos;
    xmin = std::min(xmin, s.pos->x); xmax = std::max(xmax, s.pos->x);
    ymin = std::min(ymin, s.pos->y); ymax = std::max(ymax, s.pos->y);
  }
  if (with_pos < 2) { draw_unavailable(x + kPanelPad, y + 32, Unavailable::MissingData); return; }

  // Uniform scale so the layout keeps its shape
  const float inner_w = w - 2 * kPanelPad, inner_h = h - 30.0f - kPanelPad;
  const double span = std::max({xmax - xmin, ymax - ymin, 1.0});
  const float scale = float(std::min(inner_w, inner_h) / span);
  const float cx = x + w * 0.5f, cy = y + 30.0f + inner_h * 0.5f;
  auto to_screen = [&](const Position2& p) {
    return Vector2{cx + float(p.x - 0.5 * (xmin + xmax)) * scale,
                   cy - float(p.y - 0.5 * (ymin + ymax)) * scale};
  };

  const EventMask* coast = analysis_.coast ? &*analysis_.coast : nullptr;
  const EventMask* traction = analysis_.traction ? &*analysis_.traction : nullptr;
  const TelemetrySample* prev = nullptr;
  for (std::size_t i = 0; i < t.size(); ++i) {
    if (!t[i].pos) { prev = nullptr; continue; }
    if (prev) {
      Color c = Color{90, 90, 100, 255};
      if (coast && show_coast_ && (*coast)[i])          c = Color{241, 196, 15, 255};
      if (traction && show_traction_ && (*traction)[i]) c = Color{231, 76, 60, 255};
      DrawLineEx(to_screen(*prev->pos), to_screen(*t[i].pos), 3.0f, c);
    }
    prev = &t[i];
  }
}

void DashboardApp::draw_lap_evolution_(float x, float y, float w, float h) {
  draw_panel(x, y, w, h, "Lap time evolution (s)");
  if (!analysis_.evolution) { draw_unavailable(x + kPanelPad, y + 32, analysis_.evolution.reason()); return; }
  const auto& ev = *analysis_.evolution;

  double tmin = ev.points.front().time, tmax = tmin;
  for (const auto& p : ev.points) { tmin = std::min(tmin, p.time); tmax = std::max(tmax, p.time); }
  const double pad_s = std::max(0.5, 0.05 * (tmax - tmin));
  Axis ax{double(ev.points.front().lap), double(ev.points.back().lap), x + 50.0f, x + w - kPanelPad};
  Axis ay{tmin - pad_s, tmax + pad_s, y + h - kPanelPad, y + 30.0f};

  DrawText(fmt_lap_time(tmax).c_str(), int(x + 4), int(ay.map(tmax)) - 6, 10, kText);
  DrawText(fmt_lap_time(tmin).c_str(), int(x + 4), int(ay.map(tmin)) - 6, 10, kText);

  // Mean line
  const float my = ay.map(ev.mean);
  DrawLine(int(ax.p0), int(my), int(ax.p1), int(my), kAxis);
  DrawText(TextFormat("mean %s", fmt_lap_time(ev.mean).c_str()), int(ax.p1) - 110, int(my) - 14, 12, kText);

  const Color col = toColor(analysis_.color);
  for (std::size_t i = 0; i < ev.points.size(); ++i) {
    const auto& p = ev.points[i];
    const Vector2 v{ax.map(p.lap), ay.map(p.time)};
    if (i > 0) {
      const auto& q = ev.points[i - 1];
      DrawLineEx({ax.map(q.lap), ay.map(q.time)}, v, 1.5f, toColor(analysis_.color, 140));
    }
    DrawCircleV(v, p.fastest ? 6.0f : 3.0f, p.fastest ? kFastest : col);
  }
}

void DashboardApp::draw_stints_(float x, float y, float w, float h) {
  draw_panel(x, y, w, h, "Stints / compound pace");
  float yy = y + 32.0f;
  if (!analysis_.stints) {
    draw_unavailable(x + kPanelPad, yy, analysis_.stints.reason());
    return;
  }
  const auto& segs = *analysis_.stints;
  const int last_lap = segs.back().last_lap;
  Axis ax{0.0, double(std::max(1, last_lap)), x + kPanelPad, x + w - kPanelPad};
  for (const auto& s : segs) {
    const float a = ax.map(s.first_lap - 1);
    const float b = ax.map(s.last_lap);
    DrawRectangle(int(a), int(yy), std::max(1, int(b - a)), 22, toColor(compound_color(s.compound)));
    DrawRectangleLines(int(a), int(yy), std::max(1, int(b - a)), 22, BLACK);
  }
  yy += 34.0f;

  if (!analysis_.compounds) return;
  for (const auto& c : *analysis_.compounds) {
    DrawRectangle(int(x + kPanelPad), int(yy + 3), 10, 10, toColor(compound_color(c.compound)));
    DrawText(TextFormat("%-12s %s  (%d laps)", compound_name(c.compound), fmt_lap_time(c.mean).c_str(), c.laps),
             int(x + kPanelPad + 16), int(yy), 16, kText);
    yy += 20.0f;
    if (yy > y + h - 20.0f) break;
  }
}

} // namespace f1ta
