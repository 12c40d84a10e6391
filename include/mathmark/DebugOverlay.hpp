#ifndef MATHMARK_DEBUG_OVERLAY_HPP
#define MATHMARK_DEBUG_OVERLAY_HPP

#include "mathmark/GeometryClusterer.hpp"
#include "mathmark/PageModel.hpp"

#include <string>
#include <vector>

namespace mathmark {

/**
 * @brief A classified cluster to draw on the overlay
 */
struct OverlayCluster {
  BoundingBox bbox;
  int candidateId = 0; ///< 0 when the cluster was rejected
  RejectionReason reason = RejectionReason::None;
};

struct OverlayResult {
  bool success = false;     ///< Whether the PNG was written
  std::string errorMessage; ///< Error message if failed
  std::string outputPath;   ///< Written file
};

/**
 * @brief Draw a page's primitives and cluster decisions to a PNG
 *
 * Primitive boxes are grey, accepted candidates green with their id,
 * rejected clusters red with the rejection reason. Requires Cairo; without
 * it the call fails with an error message.
 *
 * @param page Page with its primitives
 * @param clusters Classified clusters of the page
 * @param outputPath PNG file to write
 * @param scale Pixels per point
 */
OverlayResult writeClusterOverlay(const Page &page,
                                  const std::vector<OverlayCluster> &clusters,
                                  const std::string &outputPath,
                                  double scale = 2.0);

} // namespace mathmark

#endif // MATHMARK_DEBUG_OVERLAY_HPP
