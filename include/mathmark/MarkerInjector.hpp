#ifndef MATHMARK_MARKER_INJECTOR_HPP
#define MATHMARK_MARKER_INJECTOR_HPP

#include "mathmark/FormulaCandidate.hpp"
#include "mathmark/PageModel.hpp"

#include <string>
#include <vector>

namespace mathmark {

/**
 * @brief Result of writing the marked copy of a document
 */
struct InjectionResult {
  bool success = false;        ///< Whether the marked copy was written
  std::string errorMessage;    ///< Error message if failed
  std::string outputPath;      ///< Path of the marked copy
  int pagesModified = 0;       ///< Pages that received an overlay
  int markersInjected = 0;     ///< Markers drawn
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Writes a copy of a PDF with each formula covered by its marker
 *
 * For every page holding candidates a single overlay content stream is
 * appended: the original content is wrapped in q/Q, then each candidate's
 * box is painted opaque white and the marker is drawn inside it in
 * Helvetica. The overlay works in page coordinates through the inverse of
 * the page's base matrix, so the boxes line up with rasterization on rotated
 * and cropped pages too. The source file is only read.
 */
class MarkerInjector {
public:
  MarkerInjector() = default;

  /**
   * @brief Write the marked copy
   * @param sourcePath Original PDF (never modified)
   * @param pages Pages as read by readPages(), for their base matrices
   * @param candidates Accepted candidates; any order
   * @param outputPath Destination of the marked copy
   * @return InjectionResult describing the written file
   */
  InjectionResult inject(const std::string &sourcePath,
                         const std::vector<Page> &pages,
                         const std::vector<FormulaCandidate> &candidates,
                         const std::string &outputPath) const;

  /**
   * @brief Content stream drawing the cover boxes and markers of one page
   *
   * @param page Page the candidates belong to
   * @param candidates Candidates on that page
   * @param fontResource Font resource name without the leading slash
   * @return PDF content stream operators, or empty if the page matrix is
   * singular
   */
  static std::string
  buildOverlayContent(const Page &page,
                      const std::vector<const FormulaCandidate *> &candidates,
                      const std::string &fontResource);

  /// Font size that fits the marker into the box, between 4pt and 10pt
  static double fitFontSize(const BoundingBox &bbox, size_t markerLength);

  /// Approximate Helvetica advance for the marker alphabet, in em
  static constexpr double kGlyphAdvance = 0.65;

  /// Resource name under which the marker font is registered
  static const char *const kFontResource;

private:
  void writeMarkedCopy(const std::string &sourcePath,
                       const std::vector<Page> &pages,
                       const std::vector<FormulaCandidate> &candidates,
                       const std::string &outputPath,
                       InjectionResult &result) const;
};

} // namespace mathmark

#endif // MATHMARK_MARKER_INJECTOR_HPP
