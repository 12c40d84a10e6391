#ifndef MATHMARK_FORMULA_RESOLVER_HPP
#define MATHMARK_FORMULA_RESOLVER_HPP

#include "mathmark/FormulaCandidate.hpp"
#include "mathmark/LatexTranscriber.hpp"
#include "mathmark/MarkerProtocol.hpp"
#include "mathmark/PipelineConfig.hpp"
#include "mathmark/RegionRasterizer.hpp"

#include <map>
#include <string>
#include <vector>

namespace mathmark {

enum class ResolutionStatus {
  Resolved, ///< Marker replaced by LaTeX
  Failed,   ///< Marker present, no usable transcription
  Skipped   ///< Marker did not survive structural parsing
};

const char *toString(ResolutionStatus status);

/**
 * @brief Report entry for one candidate
 */
struct ResolvedFormula {
  int candidateId = 0;
  int pageIndex = 0;
  std::string marker;
  ResolutionStatus status = ResolutionStatus::Failed;
  std::string latex;  ///< Set when resolved
  std::string reason; ///< Why the candidate failed or was skipped
  int attempts = 0;   ///< Transcription requests made
};

/**
 * @brief Outcome of resolving every candidate of a document
 */
struct ResolutionReport {
  std::vector<ResolvedFormula> entries; ///< One per candidate, by id
  int markersRepaired = 0;              ///< Mangled markers made canonical
  std::vector<int> unknownMarkerIds;    ///< Markers with no candidate

  int count(ResolutionStatus status) const;
  const ResolvedFormula *find(int candidateId) const;
};

/**
 * @brief Result of the resolution pass
 */
struct ResolveResult {
  bool success = false;        ///< False only when the policy demands it
  std::string errorMessage;    ///< Error message if failed
  std::string markdown;        ///< Markdown after substitution
  ResolutionReport report;
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Replaces markers in parsed markdown with transcribed LaTeX
 *
 * Transcriptions run concurrently, but substitution happens in one pass over
 * the markdown after all of them have finished, keyed by candidate id, so
 * the output does not depend on the order in which responses arrive.
 */
class FormulaResolver {
public:
  FormulaResolver(LatexTranscriber &transcriber,
                  const MarkerProtocol &protocol, UnresolvedPolicy policy,
                  int maxConcurrency);

  /**
   * @brief Resolve every candidate against the parsed markdown
   *
   * @param markdown Output of the structural parser
   * @param candidates Every accepted candidate of the document
   * @param images Region images by candidate id
   * @param imageErrors Rasterization errors by candidate id, for candidates
   * without an image
   * @return ResolveResult with the final markdown and one report entry per
   * candidate
   */
  ResolveResult
  resolve(const std::string &markdown,
          const std::vector<FormulaCandidate> &candidates,
          const std::map<int, FormulaRegionImage> &images,
          const std::map<int, std::string> &imageErrors = {});

  /**
   * @brief Reject transcriptions that cannot be substituted
   *
   * Empty text, text containing a marker, and unbalanced braces are
   * rejected.
   */
  static bool validateLatex(const std::string &latex,
                            const MarkerProtocol &protocol,
                            std::string &reason);

  /**
   * @brief Single substitution pass
   *
   * Every marker of a resolved entry becomes $$latex$$. Markers of other
   * entries follow the policy. Markers with no entry are left as they are.
   */
  static std::string substitute(const std::string &markdown,
                                const ResolutionReport &report,
                                const MarkerProtocol &protocol,
                                UnresolvedPolicy policy);

  /// Visible text left for an unresolved formula, e.g. FORMULA_001
  static std::string placeholder(int candidateId);

  /**
   * @brief Marker-shaped text remaining in final markdown
   *
   * Escaped variants count. Under UnresolvedPolicy::Keep markers of
   * unresolved candidates are permitted.
   *
   * @return Ids of leaked markers, in order of appearance
   */
  static std::vector<int> findLeaks(const std::string &finalMarkdown,
                                    const ResolutionReport &report,
                                    const MarkerProtocol &protocol,
                                    UnresolvedPolicy policy);

private:
  LatexTranscriber &m_transcriber;
  const MarkerProtocol &m_protocol;
  UnresolvedPolicy m_policy;
  int m_maxConcurrency;
};

} // namespace mathmark

#endif // MATHMARK_FORMULA_RESOLVER_HPP
