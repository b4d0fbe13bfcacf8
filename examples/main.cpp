// Copyright 2026 The markplace Authors
//
// markplace console demo: previews a watermark on several canvas sizes,
// drags it on the main canvas and renders the final overlay when the build
// has a renderer.
//
// Usage: markplace_example [config.ini] [text]

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "markplace/markplace.hpp"

namespace {

// Used when the build has no text metrics backend.
int ApproximateMeasure(const char* text, const char*, double font_size_px,
                       double* out_width, double* out_height, void*) {
  size_t chars = 0;
  for (const char* p = text; *p; ++p) {
    if ((static_cast<unsigned char>(*p) & 0xC0) != 0x80) ++chars;
  }
  *out_width = chars * font_size_px * 0.55;
  *out_height = font_size_px * 1.2;
  return 1;
}

void PrintPlacement(const char* label, const MarkPlaceTarget& target,
                    const MarkPlacePlacement& p) {
  std::printf("  %-10s %5.0fx%-5.0f box=(%.1f, %.1f) %.1fx%.1f scale=%.3f%s\n",
              label, target.width, target.height, p.x, p.y, p.width, p.height,
              p.scale, p.visible ? "" : " (hidden)");
}

void PrintSession(markplace::Session& session,
                  const std::vector<MarkPlaceTarget>& targets) {
  for (int i = 0; i < session.target_count(); ++i) {
    PrintPlacement(i == 0 ? "main" : "preview", targets[static_cast<size_t>(i)],
                   session.placement(i));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::printf("markplace %s\n", markplace::version_string());

  MarkPlaceConfig config;
  markplace_config_init_default(&config);
  if (argc > 1 && argv[1][0]) {
    if (markplace_config_load_file(argv[1], &config) != kMarkPlaceOk)
      std::fprintf(stderr, "Cannot read %s, using defaults\n", argv[1]);
  }

  try {
    markplace::Context ctx(config);
    if (!ctx.text_measure_supported()) {
      std::printf("No built-in text metrics; using an approximation\n");
      ctx.SetTextMeasureCallback(ApproximateMeasure, nullptr);
    }

    // The face is "downloading"; placements stay hidden until it is ready.
    ctx.RegisterFont("demo", config.default_font_family, "Demo", false);
    MarkPlaceSpec spec = markplace::default_spec("demo");
    std::string text = argc > 2 ? argv[2] : "AI Generated";
    spec.text = text.c_str();
    spec.background_enabled = 1;
    spec.rounded_background_enabled = 1;
    spec.background_color = markplace::from_hex("#00000066");

    std::vector<MarkPlaceTarget> targets = {{1024, 1024}};
    std::vector<MarkPlaceTarget> extra = markplace::select_preview_sizes(
        {{1024, 1024}, {1536, 1024}, {1024, 1536}, {1792, 1024}, {1024, 1792},
         {1280, 720}});
    targets.insert(targets.end(), extra.begin(), extra.end());

    markplace::Session session(ctx, spec, targets, 0);
    std::printf("Before the font is ready:\n");
    PrintSession(session, targets);

    ctx.NotifyFontReady("demo");
    for (int frame = 0; frame < 3; ++frame) session.Tick();
    std::printf("Initial placement (%d measurement(s), %d cached):\n",
                session.measure_count(), ctx.cache_size());
    PrintSession(session, targets);

    session.OnPatch([](const MarkPlacePositionPatch& patch) {
      std::printf("  patch: anchor=%d offset=(%.1f, %.1f)\n",
                  static_cast<int>(patch.anchor), patch.offset_x,
                  patch.offset_y);
    });

    MarkPlacePlacement main = session.placement(0);
    double grab_x = main.x + main.width / 2.0;
    double grab_y = main.y + main.height / 2.0;
    std::printf("Dragging from (%.0f, %.0f) to (120, 90):\n", grab_x, grab_y);
    if (session.PointerDown(1, grab_x, grab_y)) {
      session.PointerMove(1, 120.0, 90.0);
      session.PointerUp(1, 120.0, 90.0);
    } else {
      std::printf("  overlay not draggable yet\n");
    }
    PrintSession(session, targets);

    if (ctx.render_supported()) {
      markplace::Image image(1280, 720, 0xFF3A6EA5);
      MarkPlaceSpec final_spec = session.spec();
      MarkPlacePlacement p = ctx.RenderOverlay(image, final_spec);
      std::printf("Rendered %dx%d at (%.1f, %.1f)\n", image.width(),
                  image.height(), p.x, p.y);
    } else {
      std::printf("Overlay rendering not available in this build\n");
    }
  } catch (const markplace::Error& e) {
    std::fprintf(stderr, "markplace error %d: %s\n", static_cast<int>(e.code()),
                 e.what());
    return 1;
  }
  return 0;
}
