// Copyright 2026 The markplace Authors

#include "asset/asset_tracker.h"

#include <vector>

#include "core/logger.h"

namespace markplace {
namespace internal {

AssetTracker::AssetTracker(const std::string& default_font_key,
                           const std::string& default_font_family)
    : default_key_(default_font_key) {
  FontDefinition def;
  def.key = default_font_key;
  def.family = default_font_family;
  def.display_name = default_font_family;
  def.ready = true;
  fonts_[def.key] = def;
}

void AssetTracker::RegisterFont(const FontDefinition& definition) {
  if (definition.key.empty()) return;
  FontDefinition def = definition;
  if (def.family.empty()) def.family = def.key;
  if (def.display_name.empty()) def.display_name = def.family;
  fonts_[def.key] = def;
  warned_keys_.erase(def.key);
  MARKPLACE_LOG_DEBUG("Font registered: key={} family=\"{}\" ready={}",
                      def.key, def.family, def.ready);
  if (def.ready) Dispatch({AssetEvent::Kind::kFontReady, def.key});
}

bool AssetTracker::NotifyFontReady(const std::string& key) {
  auto it = fonts_.find(key);
  if (it == fonts_.end()) {
    MARKPLACE_LOG_WARN("Font ready notification for unknown key: {}", key);
    return false;
  }
  it->second.ready = true;
  Dispatch({AssetEvent::Kind::kFontReady, key});
  return true;
}

ResolvedFont AssetTracker::ResolveFont(const std::string& key) const {
  ResolvedFont out;
  auto it = fonts_.find(key);
  if (it == fonts_.end()) {
    if (!key.empty() && warned_keys_.insert(key).second) {
      MARKPLACE_LOG_WARN("Unknown font key \"{}\", using \"{}\"", key,
                         default_key_);
    }
    it = fonts_.find(default_key_);
    out.fallback_used = !key.empty();
  }
  // The default entry is installed by the constructor and never removed.
  out.key = it->second.key;
  out.family = it->second.family;
  out.ready = it->second.ready;
  return out;
}

bool AssetTracker::IsFontReady(const std::string& key) const {
  return ResolveFont(key).ready;
}

void AssetTracker::NotifyIconDecoded(const std::string& ref, int width,
                                     int height,
                                     std::unique_ptr<Image> bitmap) {
  if (ref.empty()) return;
  IconAsset& icon = icons_[ref];
  icon.state = IconState::kDecoded;
  icon.width = width;
  icon.height = height;
  icon.bitmap = std::shared_ptr<const Image>(std::move(bitmap));
  MARKPLACE_LOG_DEBUG("Icon decoded: {} ({}x{})", ref, width, height);
  Dispatch({AssetEvent::Kind::kIconDecoded, ref});
}

void AssetTracker::NotifyIconFailed(const std::string& ref) {
  if (ref.empty()) return;
  IconAsset& icon = icons_[ref];
  icon.state = IconState::kFailed;
  icon.width = 0;
  icon.height = 0;
  icon.bitmap.reset();
  MARKPLACE_LOG_WARN("Icon failed to decode: {}", ref);
  Dispatch({AssetEvent::Kind::kIconFailed, ref});
}

IconState AssetTracker::GetIconState(const std::string& ref) const {
  auto it = icons_.find(ref);
  return it == icons_.end() ? IconState::kPending : it->second.state;
}

const IconAsset* AssetTracker::FindDecodedIcon(const std::string& ref) const {
  auto it = icons_.find(ref);
  if (it == icons_.end() || it->second.state != IconState::kDecoded)
    return nullptr;
  return &it->second;
}

int AssetTracker::Subscribe(Listener listener) {
  int id = next_listener_id_++;
  listeners_[id] = std::move(listener);
  return id;
}

void AssetTracker::Unsubscribe(int id) { listeners_.erase(id); }

void AssetTracker::Dispatch(const AssetEvent& event) {
  // Listeners may unsubscribe (or subscribe) while being notified.
  std::vector<int> ids;
  ids.reserve(listeners_.size());
  for (const auto& entry : listeners_) ids.push_back(entry.first);
  for (int id : ids) {
    auto it = listeners_.find(id);
    if (it == listeners_.end()) continue;
    Listener listener = it->second;
    listener(event);
  }
}

}  // namespace internal
}  // namespace markplace
