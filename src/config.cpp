#include <f1ta/config.hpp>

namespace f1ta {

static std::vector<Rgb> make_palette_builtin() {
  return {
    {0x06, 0x00, 0xEF},  // blue
    {0xFF, 0x87, 0x00},  // papaya
    {0xFF, 0x18, 0x01},  // red
    {0xDC, 0x14, 0x3C},  // crimson
    {0x00, 0xD2, 0xBE},  // teal
    {0xFF, 0x69, 0xB4},  // pink
    {0x32, 0xCD, 0x32},  // lime
    {0xFF, 0x45, 0x00},  // orange-red
    {0x8A, 0x2B, 0xE2},  // violet
    {0x00, 0xCE, 0xD1},  // turquoise
  };
}

const std::vector<Rgb>& default_fallback_palette() {
  static const std::vector<Rgb> pal = make_palette_builtin();
  return pal;
}

} // namespace f1ta
