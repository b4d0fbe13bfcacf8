// Copyright 2026 The markplace Authors

#include "core/config.h"

#include <cctype>
#include <cstdlib>
#include <fstream>

#include "core/logger.h"

namespace markplace {
namespace internal {

namespace {

void Trim(std::string* s) {
  while (!s->empty() && std::isspace(static_cast<unsigned char>(s->back())))
    s->pop_back();
  size_t start = 0;
  while (start < s->size() &&
         std::isspace(static_cast<unsigned char>((*s)[start])))
    ++start;
  s->erase(0, start);
}

std::string XdgConfigHome() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && xdg[0]) return xdg;
  const char* home = std::getenv("HOME");
  if (home) return std::string(home) + "/.config";
  return "/tmp";
}

}  // namespace

EngineConfig EngineConfigFromPublic(const MarkPlaceConfig& config) {
  EngineConfig out;
  if (config.stabilize_tolerance_px > 0.0)
    out.stabilize_tolerance_px = config.stabilize_tolerance_px;
  if (config.max_stabilize_frames > 0)
    out.max_stabilize_frames = config.max_stabilize_frames;
  if (config.estimate_char_width_ratio > 0.0)
    out.estimate_char_width_ratio = config.estimate_char_width_ratio;
  if (config.decoration_padding_ratio > 0.0)
    out.decoration_padding_ratio = config.decoration_padding_ratio;
  if (config.default_font_key && config.default_font_key[0])
    out.default_font_key = config.default_font_key;
  if (config.default_font_family && config.default_font_family[0])
    out.default_font_family = config.default_font_family;
  if (config.log_level >= kMarkPlaceLogTrace &&
      config.log_level <= kMarkPlaceLogFatal)
    out.log_level = config.log_level;
  return out;
}

bool SettingsFile::Load(const std::string& path) {
  data_.clear();
  std::ifstream f(path);
  if (!f) return false;
  std::string line;
  while (std::getline(f, line)) {
    Trim(&line);
    if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[')
      continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = line.substr(0, eq);
    std::string val = line.substr(eq + 1);
    Trim(&key);
    Trim(&val);
    if (key.empty()) continue;
    data_[key] = val;
  }
  return true;
}

bool SettingsFile::GetDouble(const std::string& key, double* out_value) const {
  auto it = data_.find(key);
  if (it == data_.end() || it->second.empty()) return false;
  char* end = nullptr;
  double v = std::strtod(it->second.c_str(), &end);
  if (end == it->second.c_str() || *end != '\0') return false;
  *out_value = v;
  return true;
}

bool SettingsFile::GetInt(const std::string& key, int* out_value) const {
  auto it = data_.find(key);
  if (it == data_.end() || it->second.empty()) return false;
  char* end = nullptr;
  long v = std::strtol(it->second.c_str(), &end, 10);
  if (end == it->second.c_str() || *end != '\0') return false;
  *out_value = static_cast<int>(v);
  return true;
}

bool SettingsFile::GetString(const std::string& key,
                             std::string* out_value) const {
  auto it = data_.find(key);
  if (it == data_.end()) return false;
  *out_value = it->second;
  return true;
}

std::string DefaultConfigPath() {
  return XdgConfigHome() + "/markplace/markplace.ini";
}

bool ParseLogLevel(const std::string& text, MarkPlaceLogLevel* out_level) {
  static const char* const kNames[] = {"trace", "debug", "info",
                                       "warn",  "error", "fatal"};
  std::string lower;
  for (char c : text)
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (lower == "warning") lower = "warn";
  for (int i = 0; i < 6; ++i) {
    if (lower == kNames[i]) {
      *out_level = static_cast<MarkPlaceLogLevel>(i);
      return true;
    }
  }
  if (lower.size() == 1 && lower[0] >= '0' && lower[0] <= '5') {
    *out_level = static_cast<MarkPlaceLogLevel>(lower[0] - '0');
    return true;
  }
  return false;
}

bool LoadEngineConfig(const std::string& path, EngineConfig* config) {
  SettingsFile file;
  if (!file.Load(path)) {
    MARKPLACE_LOG_WARN("Cannot open config file: {}", path);
    return false;
  }

  double d = 0.0;
  if (file.GetDouble("stabilize_tolerance_px", &d)) {
    if (d > 0.0) config->stabilize_tolerance_px = d;
    else MARKPLACE_LOG_WARN("Ignoring stabilize_tolerance_px={}", d);
  }
  if (file.GetDouble("estimate_char_width_ratio", &d)) {
    if (d > 0.0) config->estimate_char_width_ratio = d;
    else MARKPLACE_LOG_WARN("Ignoring estimate_char_width_ratio={}", d);
  }
  if (file.GetDouble("decoration_padding_ratio", &d)) {
    if (d >= 0.0) config->decoration_padding_ratio = d;
    else MARKPLACE_LOG_WARN("Ignoring decoration_padding_ratio={}", d);
  }

  int n = 0;
  if (file.GetInt("max_stabilize_frames", &n)) {
    if (n > 0) config->max_stabilize_frames = n;
    else MARKPLACE_LOG_WARN("Ignoring max_stabilize_frames={}", n);
  }

  std::string s;
  if (file.GetString("default_font_key", &s) && !s.empty())
    config->default_font_key = s;
  if (file.GetString("default_font_family", &s) && !s.empty())
    config->default_font_family = s;
  if (file.GetString("log_level", &s)) {
    MarkPlaceLogLevel level;
    if (ParseLogLevel(s, &level)) config->log_level = level;
    else MARKPLACE_LOG_WARN("Ignoring log_level={}", s);
  }

  MARKPLACE_LOG_DEBUG("Loaded {} config entries from {}", file.size(), path);
  return true;
}

}  // namespace internal
}  // namespace markplace
