#ifndef MATHMARK_REGION_RASTERIZER_HPP
#define MATHMARK_REGION_RASTERIZER_HPP

#include "mathmark/PageModel.hpp"
#include "mathmark/PipelineConfig.hpp"

#include <opencv2/opencv.hpp>

#include <memory>
#include <string>

namespace poppler {
class document;
}

namespace mathmark {

/**
 * @brief Pixel rectangle to request from the renderer for one region
 */
struct RenderGeometry {
  BoundingBox region;   ///< Expanded and page-clamped region in points
  double scale = 1.0;   ///< Effective scale after the pixel cap
  int pixelX = 0;       ///< Left edge in pixels at the effective scale
  int pixelY = 0;       ///< Top edge in pixels at the effective scale
  int pixelWidth = 0;
  int pixelHeight = 0;
  bool capped = false;  ///< Scale was reduced to honour the pixel cap
};

/**
 * @brief Compute the render rectangle for a bounding box
 *
 * The box is expanded by margin on every side and clamped to the page. The
 * output size is (box + 2 x margin) x scale, unless clamping or the
 * maxPixelDimension cap applies; the cap reduces the scale uniformly.
 */
RenderGeometry computeRenderGeometry(const BoundingBox &bbox,
                                     const Page &page, double margin,
                                     double scale, int maxPixelDimension);

/**
 * @brief Rasterized image of one formula region
 */
struct FormulaRegionImage {
  int candidateId = 0;  ///< Candidate the image belongs to
  int pageIndex = 0;    ///< 0-indexed page number
  std::string path;     ///< Stored PNG file
  int width = 0;        ///< Width in pixels
  int height = 0;       ///< Height in pixels
  double scale = 0;     ///< Effective upscale relative to 72 DPI
};

/**
 * @brief Result of rasterizing one region
 */
struct RasterResult {
  bool success = false;     ///< Whether the region was rendered and stored
  bool blank = false;       ///< Rendered, but contains no ink
  std::string errorMessage; ///< Error message if failed
  FormulaRegionImage image; ///< Stored image (valid when success)
};

/**
 * @brief Renders formula regions of a PDF at high resolution with Poppler
 *
 * The document is loaded once by open() and reused for every region.
 * Not thread-safe; use one instance per thread.
 */
class RegionRasterizer {
public:
  RegionRasterizer();
  explicit RegionRasterizer(const RasterConfig &config);
  ~RegionRasterizer();

  RegionRasterizer(const RegionRasterizer &) = delete;
  RegionRasterizer &operator=(const RegionRasterizer &) = delete;

  /**
   * @brief Load the PDF to render from
   * @param pdfPath Path to the PDF file
   * @param errorMessage Receives the reason on failure
   * @return true if the document is ready
   */
  bool open(const std::string &pdfPath, std::string &errorMessage);

  bool isOpen() const;

  /**
   * @brief Render a region and persist it as PNG
   *
   * The image is written to
   * outputDir/formula_<id>_page_<page number>.png, overwriting any earlier
   * run so repeated processing yields the same files.
   *
   * @param page Page the region lies on
   * @param bbox Region in page coordinates
   * @param candidateId Candidate identifier used in the file name
   * @param outputDir Directory for the image
   * @return RasterResult with the stored image or the failure reason
   */
  RasterResult rasterize(const Page &page, const BoundingBox &bbox,
                         int candidateId, const std::string &outputDir);

  /**
   * @brief Render a region to memory without storing it
   * @return Empty Mat on failure
   */
  cv::Mat render(const Page &page, const BoundingBox &bbox,
                 RenderGeometry &geometry, std::string &errorMessage);

  /// True if the grey-level range of the image is below the blank threshold
  bool isBlank(const cv::Mat &image) const;

  static std::string imageFileName(int candidateId, int pageIndex);

  const RasterConfig &getConfig() const { return m_config; }

private:
  RasterConfig m_config;
  std::unique_ptr<poppler::document> m_document;
};

} // namespace mathmark

#endif // MATHMARK_REGION_RASTERIZER_HPP
