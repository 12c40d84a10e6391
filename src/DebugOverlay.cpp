#include "mathmark/DebugOverlay.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>

// Cairo for PNG rendering (if available)
#ifdef HAVE_CAIRO
#include <cairo.h>
#endif

namespace mathmark {

OverlayResult writeClusterOverlay(const Page &page,
                                  const std::vector<OverlayCluster> &clusters,
                                  const std::string &outputPath,
                                  double scale) {
  OverlayResult result;
  result.success = false;
  result.outputPath = outputPath;

  try {
#ifdef HAVE_CAIRO
    int imageWidth = static_cast<int>(std::ceil(page.width * scale));
    int imageHeight = static_cast<int>(std::ceil(page.height * scale));
    if (imageWidth <= 0 || imageHeight <= 0) {
      result.errorMessage = "Page has no area";
      return result;
    }

    std::filesystem::path parent =
        std::filesystem::path(outputPath).parent_path();
    if (!parent.empty()) {
      std::filesystem::create_directories(parent);
    }

    cairo_surface_t *surface = cairo_image_surface_create(
        CAIRO_FORMAT_ARGB32, imageWidth, imageHeight);

    if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
      result.errorMessage = "Failed to create Cairo image surface";
      cairo_surface_destroy(surface);
      return result;
    }

    cairo_t *cr = cairo_create(surface);
    cairo_scale(cr, scale, scale);

    cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
    cairo_paint(cr);

    // Primitives
    cairo_set_source_rgb(cr, 0.7, 0.7, 0.7);
    cairo_set_line_width(cr, 0.5);
    for (const auto &primitive : page.primitives) {
      const BoundingBox &box = primitive.bbox;
      cairo_rectangle(cr, box.x0, box.y0, box.width(), box.height());
      cairo_stroke(cr);
    }

    cairo_select_font_face(cr, "Sans", CAIRO_FONT_SLANT_NORMAL,
                           CAIRO_FONT_WEIGHT_BOLD);
    cairo_set_font_size(cr, 7.0);
    cairo_set_line_width(cr, 1.0);

    for (const auto &cluster : clusters) {
      const BoundingBox &box = cluster.bbox;
      bool accepted = cluster.candidateId > 0;
      if (accepted) {
        cairo_set_source_rgb(cr, 0.0, 0.6, 0.0);
      } else {
        cairo_set_source_rgb(cr, 0.85, 0.0, 0.0);
      }
      cairo_rectangle(cr, box.x0, box.y0, box.width(), box.height());
      cairo_stroke(cr);

      std::string label = accepted ? "#" + std::to_string(cluster.candidateId)
                                   : toString(cluster.reason);
      cairo_move_to(cr, box.x0, std::max(7.0, box.y0 - 1.5));
      cairo_show_text(cr, label.c_str());
    }

    cairo_status_t status = cairo_surface_write_to_png(surface, outputPath.c_str());
    cairo_destroy(cr);
    cairo_surface_destroy(surface);

    if (status != CAIRO_STATUS_SUCCESS) {
      result.errorMessage = std::string("Failed to write overlay: ") +
                            cairo_status_to_string(status);
      return result;
    }

    result.success = true;
    return result;

#else
    (void)page;
    (void)clusters;
    (void)scale;
    result.errorMessage =
        "Cairo not available - debug overlays require Cairo library";
    return result;
#endif
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Error writing overlay: ") + e.what();
    return result;
  }
}

} // namespace mathmark
