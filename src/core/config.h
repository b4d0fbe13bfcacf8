// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_CORE_CONFIG_H_
#define MARKPLACE_CORE_CONFIG_H_

#include <string>
#include <unordered_map>

#include "markplace/markplace.h"

namespace markplace {
namespace internal {

constexpr const char* kDefaultFontKey = "dejavu-sans";
constexpr const char* kDefaultFontFamily = "DejaVu Sans";

/// Resolved engine configuration (every field holds a usable value).
struct EngineConfig {
  double stabilize_tolerance_px = 0.5;
  int max_stabilize_frames = 30;
  double estimate_char_width_ratio = 0.6;
  double decoration_padding_ratio = 0.3;
  std::string default_font_key = kDefaultFontKey;
  std::string default_font_family = kDefaultFontFamily;
  MarkPlaceLogLevel log_level = kMarkPlaceLogInfo;
};

/// Build an EngineConfig from the public struct; zero / NULL fields keep the
/// defaults.
EngineConfig EngineConfigFromPublic(const MarkPlaceConfig& config);

/// Flat `key = value` file.  Lines starting with '#' or ';' and section
/// headers are ignored.
class SettingsFile {
 public:
  SettingsFile() = default;

  /// Returns false if the file cannot be opened.
  bool Load(const std::string& path);

  bool GetDouble(const std::string& key, double* out_value) const;
  bool GetInt(const std::string& key, int* out_value) const;
  bool GetString(const std::string& key, std::string* out_value) const;

  size_t size() const { return data_.size(); }

 private:
  std::unordered_map<std::string, std::string> data_;
};

/// $XDG_CONFIG_HOME/markplace/markplace.ini (or ~/.config/...).
std::string DefaultConfigPath();

/// Overlay the values found in `path` onto `config`.  Unknown keys and
/// malformed values are skipped with a warning.
bool LoadEngineConfig(const std::string& path, EngineConfig* config);

/// Parse "trace".."fatal" or a numeric level.
bool ParseLogLevel(const std::string& text, MarkPlaceLogLevel* out_level);

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_CORE_CONFIG_H_
