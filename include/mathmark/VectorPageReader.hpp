#ifndef MATHMARK_VECTOR_PAGE_READER_HPP
#define MATHMARK_VECTOR_PAGE_READER_HPP

#include "mathmark/PageModel.hpp"

#include <string>
#include <vector>

namespace mathmark {

/**
 * @brief Result of reading the vector content of a PDF
 */
struct PageReadResult {
  bool success = false;        ///< Whether the document could be read
  std::string errorMessage;    ///< Error message if failed
  std::vector<Page> pages;     ///< One entry per page, in document order
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Read the vector drawing primitives of every page of a PDF
 *
 * Uses Poppler's low-level OutputDev interface. Each stroke, fill and
 * even-odd fill operation becomes one VectorPrimitive whose bounding box is
 * the CTM-transformed path in page coordinates (points, origin top-left).
 * Text and images are not recorded.
 *
 * @param pdfPath Path to the PDF file
 * @param maxPages Read at most this many pages (0 = all)
 * @return PageReadResult with one Page per processed page
 */
PageReadResult readPages(const std::string &pdfPath, int maxPages = 0);

} // namespace mathmark

#endif // MATHMARK_VECTOR_PAGE_READER_HPP
