#ifndef MATHMARK_PAGE_MODEL_HPP
#define MATHMARK_PAGE_MODEL_HPP

#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace mathmark {

/**
 * @brief Axis-aligned rectangle in page coordinates (points, origin top-left,
 * y increasing downward)
 */
struct BoundingBox {
  double x0 = 0; ///< Left edge
  double y0 = 0; ///< Top edge
  double x1 = 0; ///< Right edge
  double y1 = 0; ///< Bottom edge

  BoundingBox() = default;
  BoundingBox(double left, double top, double right, double bottom)
      : x0(left), y0(top), x1(right), y1(bottom) {}

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }
  double area() const { return width() * height(); }
  bool isEmpty() const { return x1 <= x0 || y1 <= y0; }

  /// Grow by dx on the left and right and by dy on the top and bottom
  BoundingBox expanded(double dx, double dy) const {
    return BoundingBox(x0 - dx, y0 - dy, x1 + dx, y1 + dy);
  }

  BoundingBox unite(const BoundingBox &other) const {
    return BoundingBox(std::min(x0, other.x0), std::min(y0, other.y0),
                       std::max(x1, other.x1), std::max(y1, other.y1));
  }

  BoundingBox intersect(const BoundingBox &other) const {
    return BoundingBox(std::max(x0, other.x0), std::max(y0, other.y0),
                       std::min(x1, other.x1), std::min(y1, other.y1));
  }

  /// Closed-interval test: touching edges count as intersecting
  bool intersects(const BoundingBox &other) const {
    return x0 <= other.x1 && other.x0 <= x1 && y0 <= other.y1 &&
           other.y0 <= y1;
  }

  bool operator==(const BoundingBox &other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
           y1 == other.y1;
  }
  bool operator!=(const BoundingBox &other) const { return !(*this == other); }
};

/**
 * @brief A single drawing operation (stroke or fill of a path) recorded from
 * the page content stream
 */
struct VectorPrimitive {
  BoundingBox bbox;      ///< Bounding box of the transformed path
  bool filled = false;   ///< Produced by a fill operator
  bool stroked = false;  ///< Produced by a stroke operator
  double lineWidth = 0;  ///< Stroke width in points
  int segmentCount = 0;  ///< Number of path segments
  bool hasCurves = false; ///< Path contains Bezier segments
  bool isRectangle = false; ///< Path is a single axis-aligned rectangle

  /// Straight stroke or hairline fill at most 2pt thick and at least 8pt long
  bool isHorizontalRule() const {
    return !hasCurves && bbox.height() <= 2.0 && bbox.width() >= 8.0;
  }
  bool isVerticalRule() const {
    return !hasCurves && bbox.width() <= 2.0 && bbox.height() >= 8.0;
  }
};

/**
 * @brief Transformation matrix [a b c d e f] as used by PDF content streams
 */
using Matrix = std::array<double, 6>;

/**
 * @brief One page of the source document with its vector primitives
 */
struct Page {
  int index = 0;         ///< 0-indexed page number
  double width = 0;      ///< Page width in points
  double height = 0;     ///< Page height in points
  int pixelWidth = 0;    ///< Width in pixels at 72 DPI
  int pixelHeight = 0;   ///< Height in pixels at 72 DPI
  Matrix baseMatrix = {1, 0, 0, 1, 0, 0}; ///< PDF user space -> page space
  std::vector<VectorPrimitive> primitives; ///< Drawing operations in order

  BoundingBox bounds() const { return BoundingBox(0, 0, width, height); }
};

/// Apply a matrix to a point
inline void transformPoint(const Matrix &m, double x, double y, double &tx,
                           double &ty) {
  tx = m[0] * x + m[2] * y + m[4];
  ty = m[1] * x + m[3] * y + m[5];
}

/// Inverse of an affine matrix; returns false if singular
bool invertMatrix(const Matrix &m, Matrix &inverse);

} // namespace mathmark

#endif // MATHMARK_PAGE_MODEL_HPP
