#include "mathmark/RegionRasterizer.hpp"

#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace mathmark {

RenderGeometry computeRenderGeometry(const BoundingBox &bbox,
                                     const Page &page, double margin,
                                     double scale, int maxPixelDimension) {
  RenderGeometry geometry;
  geometry.region = bbox.expanded(margin, margin).intersect(page.bounds());
  geometry.scale = scale;

  double width = geometry.region.width();
  double height = geometry.region.height();
  if (width <= 0 || height <= 0) {
    return geometry;
  }

  if (maxPixelDimension > 0) {
    double largest = std::max(width, height) * scale;
    if (largest > maxPixelDimension) {
      geometry.scale = maxPixelDimension / std::max(width, height);
      geometry.capped = true;
    }
  }

  geometry.pixelX =
      static_cast<int>(std::floor(geometry.region.x0 * geometry.scale));
  geometry.pixelY =
      static_cast<int>(std::floor(geometry.region.y0 * geometry.scale));
  geometry.pixelWidth = static_cast<int>(std::lround(width * geometry.scale));
  geometry.pixelHeight =
      static_cast<int>(std::lround(height * geometry.scale));
  if (maxPixelDimension > 0) {
    geometry.pixelWidth = std::min(geometry.pixelWidth, maxPixelDimension);
    geometry.pixelHeight = std::min(geometry.pixelHeight, maxPixelDimension);
  }
  return geometry;
}

RegionRasterizer::RegionRasterizer() : m_config() {}

RegionRasterizer::RegionRasterizer(const RasterConfig &config)
    : m_config(config) {}

RegionRasterizer::~RegionRasterizer() = default;

bool RegionRasterizer::open(const std::string &pdfPath,
                            std::string &errorMessage) {
  m_document.reset(poppler::document::load_from_file(pdfPath));
  if (!m_document) {
    errorMessage = "Failed to load PDF file: " + pdfPath;
    return false;
  }
  if (m_document->is_locked()) {
    errorMessage = "PDF file is password protected: " + pdfPath;
    m_document.reset();
    return false;
  }
  return true;
}

bool RegionRasterizer::isOpen() const { return m_document != nullptr; }

std::string RegionRasterizer::imageFileName(int candidateId, int pageIndex) {
  std::ostringstream name;
  name << "formula_" << std::setw(3) << std::setfill('0') << candidateId
       << "_page_" << std::setw(3) << std::setfill('0') << (pageIndex + 1)
       << ".png";
  return name.str();
}

cv::Mat RegionRasterizer::render(const Page &page, const BoundingBox &bbox,
                                 RenderGeometry &geometry,
                                 std::string &errorMessage) {
  if (!m_document) {
    errorMessage = "No document open";
    return cv::Mat();
  }
  if (page.index < 0 || page.index >= m_document->pages()) {
    errorMessage = "Page index out of range: " + std::to_string(page.index);
    return cv::Mat();
  }

  geometry = computeRenderGeometry(bbox, page, m_config.margin,
                                   m_config.scale, m_config.maxPixelDimension);
  if (geometry.pixelWidth <= 0 || geometry.pixelHeight <= 0) {
    errorMessage = "Region lies outside the page";
    return cv::Mat();
  }

  std::unique_ptr<poppler::page> popplerPage(
      m_document->create_page(page.index));
  if (!popplerPage) {
    errorMessage = "Failed to create page " + std::to_string(page.index + 1);
    return cv::Mat();
  }

  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  double dpi = 72.0 * geometry.scale;
  poppler::image popplerImage = renderer.render_page(
      popplerPage.get(), dpi, dpi, geometry.pixelX, geometry.pixelY,
      geometry.pixelWidth, geometry.pixelHeight);

  if (!popplerImage.is_valid()) {
    errorMessage = "Failed to render region on page " +
                   std::to_string(page.index + 1);
    return cv::Mat();
  }

  // Convert Poppler image to OpenCV Mat
  int width = popplerImage.width();
  int height = popplerImage.height();
  cv::Mat mat;

  switch (popplerImage.format()) {
  case poppler::image::format_argb32: {
    // ARGB32 is BGRA in memory on little-endian machines
    mat = cv::Mat(height, width, CV_8UC4,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
    break;
  }
  case poppler::image::format_rgb24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
    break;
  }
  case poppler::image::format_bgr24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    break;
  }
  case poppler::image::format_gray8: {
    mat = cv::Mat(height, width, CV_8UC1,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    break;
  }
  default:
    errorMessage = "Unsupported image format";
    return cv::Mat();
  }

  return mat;
}

bool RegionRasterizer::isBlank(const cv::Mat &image) const {
  if (image.empty()) {
    return true;
  }
  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image;
  }
  double minVal = 0, maxVal = 0;
  cv::minMaxLoc(gray, &minVal, &maxVal);
  return (maxVal - minVal) < m_config.blankThreshold;
}

RasterResult RegionRasterizer::rasterize(const Page &page,
                                         const BoundingBox &bbox,
                                         int candidateId,
                                         const std::string &outputDir) {
  RasterResult result;
  result.success = false;

  try {
    RenderGeometry geometry;
    cv::Mat image = render(page, bbox, geometry, result.errorMessage);
    if (image.empty()) {
      return result;
    }

    if (isBlank(image)) {
      result.blank = true;
      result.errorMessage = "Region rendered blank";
      return result;
    }

    std::filesystem::create_directories(outputDir);
    std::string outputPath =
        (std::filesystem::path(outputDir) /
         imageFileName(candidateId, page.index))
            .string();

    if (!cv::imwrite(outputPath, image)) {
      result.errorMessage = "Failed to write image: " + outputPath;
      return result;
    }

    result.image.candidateId = candidateId;
    result.image.pageIndex = page.index;
    result.image.path = outputPath;
    result.image.width = image.cols;
    result.image.height = image.rows;
    result.image.scale = geometry.scale;
    result.success = true;

  } catch (const std::exception &e) {
    result.errorMessage = std::string("Region rasterization failed: ") + e.what();
  }

  return result;
}

} // namespace mathmark
