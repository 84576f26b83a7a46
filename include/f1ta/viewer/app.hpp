#pragma once
#include <cstddef>
#include <f1ta/analysis.hpp>

namespace f1ta {

class AnalysisController;

// RAII application that renders the analysis of the selected driver.
class DashboardApp {
public:
  explicit DashboardApp(AnalysisController& ctl);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void select_(std::size_t roster_index);
  // Rendering
  void render_frame_();
  void draw_hud_();
  void draw_speed_trace_(float x, float y, float w, float h);
  void draw_circuit_(float x, float y, float w, float h);
  void draw_lap_evolution_(float x, float y, float w, float h);
  void draw_stints_(float x, float y, float w, float h);

  // Dependencies
  AnalysisController& ctl_;

  // Selection state
  std::size_t roster_idx_{0};
  DriverAnalysis analysis_{};

  // UI state
  bool show_coast_{true};
  bool show_traction_{true};
};

} // namespace f1ta
