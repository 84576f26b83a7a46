#include <f1ta/io/config_yaml.hpp>
#include <cmath>
#include <sstream>
#include <yaml-cpp/yaml.h>
#include <f1ta/errors.hpp>

namespace f1ta::io {

using errors::ConfigError;

namespace {

std::string invalid_field(const std::string& origin, const std::string& field) {
  std::ostringstream oss;
  oss << "Invalid value for '" << field << "' in " << origin;
  return oss.str();
}

// Overwrites out only when the key is present.
void read_double(const YAML::Node& node, const char* key, const std::string& field,
                 const std::string& origin, double& out) {
  const auto v = node[key];
  if (!v) return;
  if (!v.IsScalar()) throw ConfigError(invalid_field(origin, field));
  try {
    out = v.as<double>();
  } catch (const YAML::BadConversion&) {
    throw ConfigError(invalid_field(origin, field));
  }
  if (!std::isfinite(out)) throw ConfigError(invalid_field(origin, field));
}

void require_percent(double v, const std::string& origin, const std::string& field) {
  if (v < 0.0 || v > 100.0) throw ConfigError(invalid_field(origin, field));
}

void require_non_negative(double v, const std::string& origin, const std::string& field) {
  if (v < 0.0) throw ConfigError(invalid_field(origin, field));
}

AnalyticsConfig from_node(const YAML::Node& root, const std::string& origin) {
  AnalyticsConfig cfg;
  if (!root || root.IsNull()) return cfg;
  if (!root.IsMap()) throw ConfigError("Invalid YAML root: " + origin);

  if (const auto det = root["detector"]; det) {
    if (!det.IsMap()) throw ConfigError(invalid_field(origin, "detector"));
    auto& d = cfg.detector;
    read_double(det, "coast_throttle_max", "detector.coast_throttle_max", origin, d.coast_throttle_max);
    read_double(det, "traction_rpm_rise", "detector.traction_rpm_rise", origin, d.traction_rpm_rise);
    read_double(det, "traction_speed_rise_max", "detector.traction_speed_rise_max", origin,
                d.traction_speed_rise_max);
    read_double(det, "traction_throttle_min", "detector.traction_throttle_min", origin,
                d.traction_throttle_min);
    require_percent(d.coast_throttle_max, origin, "detector.coast_throttle_max");
    require_non_negative(d.traction_rpm_rise, origin, "detector.traction_rpm_rise");
    require_percent(d.traction_throttle_min, origin, "detector.traction_throttle_min");
  }

  if (const auto eff = root["efficiency"]; eff) {
    if (!eff.IsMap()) throw ConfigError(invalid_field(origin, "efficiency"));
    read_double(eff, "full_throttle", "efficiency.full_throttle", origin, cfg.full_throttle_threshold);
    require_percent(cfg.full_throttle_threshold, origin, "efficiency.full_throttle");
  }

  if (const auto pal = root["fallback_palette"]; pal) {
    if (!pal.IsSequence() || pal.size() == 0) throw ConfigError(invalid_field(origin, "fallback_palette"));
    std::vector<Rgb> colors;
    for (std::size_t i = 0; i < pal.size(); ++i) {
      const std::string field = "fallback_palette[" + std::to_string(i) + "]";
      if (!pal[i].IsScalar()) throw ConfigError(invalid_field(origin, field));
      auto c = rgb_from_hex(pal[i].as<std::string>());
      if (!c) throw ConfigError(invalid_field(origin, field));
      colors.push_back(*c);
    }
    cfg.fallback_palette = std::move(colors);
  }

  if (const auto rep = root["report"]; rep) {
    if (!rep.IsMap()) throw ConfigError(invalid_field(origin, "report"));
    if (const auto dec = rep["decimals"]; dec) {
      try {
        cfg.report_decimals = dec.as<int>();
      } catch (const YAML::BadConversion&) {
        throw ConfigError(invalid_field(origin, "report.decimals"));
      }
      if (cfg.report_decimals < 0 || cfg.report_decimals > 6) {
        throw ConfigError(invalid_field(origin, "report.decimals"));
      }
    }
  }
  return cfg;
}

} // namespace

AnalyticsConfig analytics_config_from_string(std::string_view yaml, const std::string& origin) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("YAML parse error: ") + e.what(), origin);
  }
  return from_node(root, origin);
}

AnalyticsConfig load_analytics_config(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw ConfigError("cannot open configuration file", path);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("YAML parse error: ") + e.what(), path);
  }
  return from_node(root, path);
}

} // namespace f1ta::io
