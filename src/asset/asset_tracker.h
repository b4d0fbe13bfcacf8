// Copyright 2026 The markplace Authors

#ifndef MARKPLACE_ASSET_ASSET_TRACKER_H_
#define MARKPLACE_ASSET_ASSET_TRACKER_H_

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>

#include "core/image.h"

namespace markplace {
namespace internal {

struct FontDefinition {
  std::string key;
  std::string family;
  std::string display_name;
  bool ready = false;
};

/// Result of looking a font key up in the registry.
struct ResolvedFont {
  std::string key;
  std::string family;
  bool ready = false;
  bool fallback_used = false;
};

enum class IconState { kPending, kDecoded, kFailed };

struct IconAsset {
  IconState state = IconState::kPending;
  int width = 0;
  int height = 0;
  std::shared_ptr<const Image> bitmap;  // May be null for size-only decodes.
};

struct AssetEvent {
  enum class Kind { kFontReady, kIconDecoded, kIconFailed };
  Kind kind;
  std::string key;
};

/// Font registry plus font / icon readiness.  Completions may arrive in any
/// order and any number of times; each is fanned out to subscribers in
/// registration order.
class AssetTracker {
 public:
  using Listener = std::function<void(const AssetEvent&)>;

  AssetTracker(const std::string& default_font_key,
               const std::string& default_font_family);
  ~AssetTracker() = default;

  AssetTracker(const AssetTracker&) = delete;
  AssetTracker& operator=(const AssetTracker&) = delete;

  /// Add or replace a registry entry.  Registering a ready font notifies
  /// subscribers.
  void RegisterFont(const FontDefinition& definition);

  /// Mark a registered font as loaded.  Returns false for unknown keys.
  bool NotifyFontReady(const std::string& key);

  /// Look up `key`; empty or unknown keys resolve to the default font.
  ResolvedFont ResolveFont(const std::string& key) const;

  /// Readiness after fallback resolution.
  bool IsFontReady(const std::string& key) const;

  void NotifyIconDecoded(const std::string& ref, int width, int height,
                         std::unique_ptr<Image> bitmap);
  void NotifyIconFailed(const std::string& ref);

  /// Unknown refs are pending.
  IconState GetIconState(const std::string& ref) const;

  /// nullptr unless the icon was decoded.
  const IconAsset* FindDecodedIcon(const std::string& ref) const;

  const std::string& default_font_key() const { return default_key_; }

  int Subscribe(Listener listener);
  void Unsubscribe(int id);

 private:
  void Dispatch(const AssetEvent& event);

  std::string default_key_;
  std::unordered_map<std::string, FontDefinition> fonts_;
  std::unordered_map<std::string, IconAsset> icons_;
  std::map<int, Listener> listeners_;
  int next_listener_id_ = 1;
  mutable std::set<std::string> warned_keys_;
};

}  // namespace internal
}  // namespace markplace

#endif  // MARKPLACE_ASSET_ASSET_TRACKER_H_
