#ifndef MATHMARK_TESTS_TEST_PAGES_HPP
#define MATHMARK_TESTS_TEST_PAGES_HPP

#include "mathmark/PageModel.hpp"

namespace mathmark {
namespace testing {

// US Letter, as poppler reports it for an unrotated page
inline Page letterPage(int index = 0) {
  Page page;
  page.index = index;
  page.width = 612;
  page.height = 792;
  page.pixelWidth = 612;
  page.pixelHeight = 792;
  page.baseMatrix = {1, 0, 0, -1, 0, 792};
  return page;
}

// Filled outline of a glyph
inline VectorPrimitive glyph(double x, double y, double width, double height) {
  VectorPrimitive primitive;
  primitive.bbox = BoundingBox(x, y, x + width, y + height);
  primitive.filled = true;
  primitive.hasCurves = true;
  primitive.segmentCount = 8;
  return primitive;
}

inline VectorPrimitive horizontalRule(double x0, double x1, double y,
                                      double thickness = 1.0) {
  VectorPrimitive primitive;
  primitive.bbox =
      BoundingBox(x0, y - thickness / 2, x1, y + thickness / 2);
  primitive.stroked = true;
  primitive.lineWidth = thickness;
  primitive.segmentCount = 1;
  return primitive;
}

inline VectorPrimitive verticalRule(double x, double y0, double y1,
                                    double thickness = 1.0) {
  VectorPrimitive primitive;
  primitive.bbox =
      BoundingBox(x - thickness / 2, y0, x + thickness / 2, y1);
  primitive.stroked = true;
  primitive.lineWidth = thickness;
  primitive.segmentCount = 1;
  return primitive;
}

inline VectorPrimitive rectangle(double x, double y, double width,
                                 double height, bool filled = false) {
  VectorPrimitive primitive;
  primitive.bbox = BoundingBox(x, y, x + width, y + height);
  primitive.filled = filled;
  primitive.stroked = !filled;
  primitive.segmentCount = 4;
  primitive.isRectangle = true;
  return primitive;
}

// A row of 12x14pt glyphs with 2pt gaps starting at (x, y)
inline void addFormula(Page &page, double x, double y, int glyphs) {
  for (int i = 0; i < glyphs; i++) {
    page.primitives.push_back(glyph(x + i * 14.0, y, 12.0, 14.0));
  }
}

} // namespace testing
} // namespace mathmark

#endif // MATHMARK_TESTS_TEST_PAGES_HPP
