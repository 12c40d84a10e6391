#include "mathmark/VectorPageReader.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <memory>

// Poppler low-level API for path extraction
#include <GfxState.h>
#include <GlobalParams.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <Page.h>
#include <goo/GooString.h>

namespace mathmark {

// Custom OutputDev to record every painted path of a page
namespace {

class PrimitiveCollectorOutputDev : public OutputDev {
public:
  PrimitiveCollectorOutputDev() = default;

  Page &getPage() { return page; }

  void setPageIndex(int index) {
    page = Page();
    page.index = index;
  }

  // Required OutputDev overrides
  bool upsideDown() override { return true; } // top-left origin, y down
  bool useDrawChar() override { return false; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return true; }

  void startPage(int /*pageNum*/, GfxState *state, XRef * /*xref*/) override {
    if (!state) {
      return;
    }
    page.width = state->getPageWidth();
    page.height = state->getPageHeight();
    page.pixelWidth = static_cast<int>(std::ceil(page.width));
    page.pixelHeight = static_cast<int>(std::ceil(page.height));
    const auto &ctm = state->getCTM();
    for (int i = 0; i < 6; i++) {
      page.baseMatrix[i] = ctm[i];
    }
  }

  void stroke(GfxState *state) override { recordPath(state, false, true); }
  void fill(GfxState *state) override { recordPath(state, true, false); }
  void eoFill(GfxState *state) override { recordPath(state, true, false); }

private:
  void recordPath(GfxState *state, bool isFilled, bool isStroked) {
    const GfxPath *path = state->getPath();
    if (!path || path->getNumSubpaths() == 0)
      return;

    const auto &ctm = state->getCTM();
    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();

    VectorPrimitive primitive;
    for (int i = 0; i < path->getNumSubpaths(); i++) {
      const GfxSubpath *subpath = path->getSubpath(i);
      int numPoints = subpath->getNumPoints();
      if (numPoints < 1)
        continue;

      primitive.segmentCount += numPoints - 1;
      if (subpath->isClosed())
        primitive.segmentCount++;

      for (int j = 0; j < numPoints; j++) {
        if (subpath->getCurve(j))
          primitive.hasCurves = true;

        // Transform through CTM; control points are included so the box
        // always contains the curve
        double tx = ctm[0] * subpath->getX(j) + ctm[2] * subpath->getY(j) +
                    ctm[4];
        double ty = ctm[1] * subpath->getX(j) + ctm[3] * subpath->getY(j) +
                    ctm[5];
        minX = std::min(minX, tx);
        minY = std::min(minY, ty);
        maxX = std::max(maxX, tx);
        maxY = std::max(maxY, ty);
      }
    }

    if (minX > maxX || minY > maxY)
      return;

    // Stroked lines have zero extent in one direction; give them the
    // stroke width so they occupy area
    double halfWidth = isStroked ? state->getTransformedLineWidth() / 2.0 : 0;
    primitive.bbox = BoundingBox(minX - halfWidth, minY - halfWidth,
                                 maxX + halfWidth, maxY + halfWidth);
    primitive.filled = isFilled;
    primitive.stroked = isStroked;
    primitive.lineWidth = state->getLineWidth();
    primitive.isRectangle =
        path->getNumSubpaths() == 1 && isRectangle(path->getSubpath(0), ctm);

    page.primitives.push_back(primitive);
  }

  // A rectangle has 4 corners (5 with an explicit closing point), no curves,
  // and exactly 2 distinct X values and 2 distinct Y values once transformed
  bool isRectangle(const GfxSubpath *subpath, const std::array<double, 6> &ctm) {
    int numPoints = subpath->getNumPoints();
    if (numPoints < 4 || numPoints > 5)
      return false;
    if (!subpath->isClosed() && numPoints != 5)
      return false;

    const double tolerance = 0.5; // Half a point tolerance
    std::vector<double> xVals, yVals;
    for (int j = 0; j < 4; j++) {
      if (subpath->getCurve(j))
        return false;
      double tx = ctm[0] * subpath->getX(j) + ctm[2] * subpath->getY(j) +
                  ctm[4];
      double ty = ctm[1] * subpath->getX(j) + ctm[3] * subpath->getY(j) +
                  ctm[5];

      bool foundX = false, foundY = false;
      for (double xv : xVals) {
        if (std::abs(tx - xv) < tolerance) {
          foundX = true;
          break;
        }
      }
      for (double yv : yVals) {
        if (std::abs(ty - yv) < tolerance) {
          foundY = true;
          break;
        }
      }
      if (!foundX)
        xVals.push_back(tx);
      if (!foundY)
        yVals.push_back(ty);
    }
    return xVals.size() == 2 && yVals.size() == 2;
  }

  Page page;
};

void collectPages(const std::string &pdfPath, int maxPages,
                  PageReadResult &result) {
  // Initialize Poppler's global parameters (required for low-level API)
  GlobalParamsIniter globalParamsInit(nullptr);

  auto fileName = std::make_unique<GooString>(pdfPath);
  std::unique_ptr<PDFDoc> doc(new PDFDoc(std::move(fileName)));

  if (!doc->isOk()) {
    result.errorMessage = "Failed to load PDF file: " + pdfPath;
    return;
  }

  int pageCount = doc->getNumPages();
  if (pageCount < 1) {
    result.errorMessage = "PDF has no pages";
    return;
  }
  if (maxPages > 0 && maxPages < pageCount) {
    pageCount = maxPages;
  }

  PrimitiveCollectorOutputDev outputDev;

  // Poppler pages are 1-indexed
  for (int pageNum = 1; pageNum <= pageCount; pageNum++) {
    outputDev.setPageIndex(pageNum - 1);
    // Crop box coordinates, matching poppler::page_renderer
    doc->displayPage(&outputDev, pageNum, 72.0, 72.0, // DPI
                     0,                               // rotation
                     false,                           // useMediaBox
                     true,                            // crop
                     false);                          // printing
    result.pages.push_back(std::move(outputDev.getPage()));
  }

  result.success = true;
}

} // anonymous namespace

PageReadResult readPages(const std::string &pdfPath, int maxPages) {
  PageReadResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    collectPages(pdfPath, maxPages, result);
  } catch (const std::exception &e) {
    result.errorMessage =
        std::string("PDF vector extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace mathmark
