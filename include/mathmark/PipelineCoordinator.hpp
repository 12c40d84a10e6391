#ifndef MATHMARK_PIPELINE_COORDINATOR_HPP
#define MATHMARK_PIPELINE_COORDINATOR_HPP

#include "mathmark/DebugOverlay.hpp"
#include "mathmark/FormulaCandidate.hpp"
#include "mathmark/FormulaResolver.hpp"
#include "mathmark/LatexTranscriber.hpp"
#include "mathmark/MarkerProtocol.hpp"
#include "mathmark/PageModel.hpp"
#include "mathmark/PipelineConfig.hpp"
#include "mathmark/StructuralParser.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mathmark {

/**
 * @brief Counts and timings of one processed document
 */
struct ProcessingSummary {
  int pages = 0;
  int clusters = 0;
  int candidates = 0;
  int resolved = 0;
  int failed = 0;
  int skipped = 0;
  int markersRepaired = 0;
  std::map<RejectionReason, int> rejected; ///< Rejected clusters by reason

  double readMs = 0;
  double clusterMs = 0;
  double rasterMs = 0;
  double injectMs = 0;
  double parseMs = 0;
  double resolveMs = 0;
};

/**
 * @brief Result of processing one document
 */
struct ProcessResult {
  bool success = false;          ///< Whether the final markdown was written
  std::string errorMessage;      ///< Error message if failed
  std::string documentName;      ///< Input file stem
  std::string finalMarkdown;     ///< Markdown with LaTeX substituted
  std::string outputPath;        ///< Written markdown file
  std::string markedPdfPath;     ///< Marked working copy, if one was made
  std::vector<FormulaCandidate> candidates; ///< Accepted candidates by id
  ResolutionReport report;       ///< One entry per candidate
  std::vector<int> leakedMarkerIds; ///< Markers left in the final markdown
  std::vector<std::string> warnings;
  ProcessingSummary summary;
  double processingTimeMs = 0;   ///< Total processing time in milliseconds
};

/// Human-readable processing summary
std::string formatSummary(const ProcessResult &result);

/**
 * @brief Candidates found on a set of pages
 */
struct DetectionResult {
  std::vector<FormulaCandidate> candidates; ///< In document reading order
  std::map<RejectionReason, int> rejected;
  int clusterCount = 0;
  std::vector<std::vector<OverlayCluster>> pageClusters; ///< Per page
};

/**
 * @brief Serializes processing of documents that share a name
 *
 * Artifacts live under workDir/<name>, so two runs for the same name must
 * not interleave. Runs for different names proceed in parallel.
 *
 * One mutex is kept per distinct name for the life of the registry and is
 * never released, so memory grows with the number of distinct names a
 * long-running process has seen (one small entry each).
 */
class DocumentLockRegistry {
public:
  std::unique_lock<std::mutex> lock(const std::string &documentName);

  /// Number of distinct names seen so far
  size_t size() const;

  /// Registry shared by every coordinator in the process
  static DocumentLockRegistry &global();

private:
  mutable std::mutex m_mutex;
  std::map<std::string, std::unique_ptr<std::mutex>> m_locks;
};

/**
 * @brief Runs the hybrid formula extraction for a document
 *
 * Stages: read vector pages, cluster pages in parallel, classify and number
 * candidates, rasterize regions, inject markers into a working copy, parse
 * the copy to markdown, resolve markers to LaTeX, check that no marker
 * leaked, and write <workDir>/<name>/<name>.md.
 *
 * Example usage:
 * @code
 * mathmark::PipelineConfig config;
 * mathmark::applyEnvironment(config);
 * mathmark::PipelineCoordinator coordinator(config);
 * auto result = coordinator.process("paper.pdf");
 * if (result.success) {
 *     std::cout << formatSummary(result);
 * }
 * @endcode
 */
class PipelineCoordinator {
public:
  explicit PipelineCoordinator(const PipelineConfig &config);

  /// Use the given collaborators instead of the configured ones
  PipelineCoordinator(const PipelineConfig &config,
                      std::unique_ptr<StructuralParser> parser,
                      std::unique_ptr<LatexTranscriber> transcriber);

  ProcessResult process(const std::string &pdfPath);

  /**
   * @brief Quick check on the first pages of a document
   * @return true if any sampled page holds a formula-like cluster
   */
  bool hasVectorFormulas(const std::string &pdfPath) const;

  /**
   * @brief Cluster and classify pages, numbering accepted clusters
   *
   * Pages are clustered in parallel; ids are assigned afterwards in page
   * order, then reading order within the page, so numbering does not
   * depend on scheduling.
   */
  static DetectionResult detectCandidates(const std::vector<Page> &pages,
                                          const ClusterConfig &config,
                                          int threads,
                                          const MarkerProtocol &protocol,
                                          CandidateIdCounter &counter);

  /// Name used for the artifact directory, the input file stem
  static std::string documentName(const std::string &pdfPath);

  const PipelineConfig &getConfig() const { return m_config; }

private:
  /// Stages of process(); failures set result.errorMessage and return
  void runStages(const std::string &pdfPath, ProcessResult &result);

  PipelineConfig m_config;
  MarkerProtocol m_protocol;
  std::unique_ptr<StructuralParser> m_parser;
  std::unique_ptr<LatexTranscriber> m_transcriber;
};

} // namespace mathmark

#endif // MATHMARK_PIPELINE_COORDINATOR_HPP
