#ifndef MATHMARK_PIPELINE_CONFIG_HPP
#define MATHMARK_PIPELINE_CONFIG_HPP

#include <string>

namespace mathmark {

/**
 * @brief Thresholds for grouping primitives and classifying clusters
 *
 * Fractions are relative to the page size; absolute sizes are in points.
 */
struct ClusterConfig {
  double proximityX = 0.05;   ///< Horizontal merge gap, fraction of page width
  double proximityY = 0.005;  ///< Vertical merge gap, fraction of page height
  double backgroundCoverage = 0.9; ///< Primitives covering this much of the
                                   ///< page are treated as background
  double rowTolerance = 4.0;  ///< Top edges within this distance share a row

  double headerFooterBand = 0.08; ///< Top/bottom band, fraction of height
  double minWidth = 30.0;         ///< Minimum formula width in points
  double minHeight = 10.0;        ///< Minimum formula height in points
  int minPrimitives = 3;          ///< Minimum primitives per formula
  double maxAreaFraction = 0.6;   ///< Larger clusters are whole-page art
  double maxHeightFraction = 0.5; ///< Taller clusters are whole-page art
  double fullWidthFraction = 0.9; ///< Width at which the rule check applies
  double minFullWidthDensity = 2.0; ///< Primitives per 100pt of width needed
                                    ///< for a full-width cluster
  double tableRuleCoverage = 0.8; ///< Rule length relative to the cluster for
                                  ///< a rule to count as a table border
};

/**
 * @brief Region rendering settings
 */
struct RasterConfig {
  double scale = 4.0;           ///< Upscale relative to 72 DPI
  double margin = 3.0;          ///< Padding around the bounding box in points
  int maxPixelDimension = 4096; ///< Cap on output width and height
  int blankThreshold = 16;      ///< Grey-level range below which a region is
                                ///< considered blank
};

/**
 * @brief Transcription backend selection and vision endpoint settings
 */
struct VisionConfig {
  enum class Backend {
    OpenAICompatible, ///< Chat-completions endpoint with image input
    Tesseract         ///< Local OCR, no network
  };

  Backend backend = Backend::OpenAICompatible;
  std::string apiUrl = "https://api.groq.com/openai/v1/chat/completions";
  std::string apiKey;
  std::string model = "meta-llama/llama-4-scout-17b-16e-instruct";
  int maxTokens = 500;
  int timeoutSeconds = 60;   ///< Per request
  int maxAttempts = 4;       ///< Retries on HTTP 429 and 5xx
  int maxConcurrency = 4;    ///< Worker pool size
  double requestsPerSecond = 3.0;

  std::string tessDataPath;  ///< Empty = TESSDATA_PREFIX or default
  std::string language = "eng";
};

/**
 * @brief How markers without a LaTeX transcription are handled
 */
enum class UnresolvedPolicy {
  Placeholder, ///< Replace with a visible failed-extraction placeholder
  Strip,       ///< Remove the marker
  Keep,        ///< Leave the marker verbatim
  Fail         ///< Fail the whole document
};

/**
 * @brief Structural parser selection
 */
struct ParserConfig {
  enum class Kind {
    PopplerText, ///< Built-in text layer extraction
    Command      ///< External converter run through the shell
  };

  Kind kind = Kind::PopplerText;
  /// {input} and {output_dir} are substituted as single-quoted shell words,
  /// so the template must not quote them again
  std::string command = "docling --to md --output {output_dir} {input}";
};

/**
 * @brief Top-level configuration for processing a document
 */
struct PipelineConfig {
  std::string workDir = "data/work"; ///< Root of per-document artifacts
  ClusterConfig cluster;
  RasterConfig raster;
  VisionConfig vision;
  ParserConfig parser;
  UnresolvedPolicy unresolvedPolicy = UnresolvedPolicy::Placeholder;
  int clusterThreads = 4;         ///< Parallel page clustering
  int detectionSamplePages = 3;   ///< Pages sampled by the quick check
  bool skipWithoutFormulas = true; ///< Parse the original when none found
  bool writeDebugOverlays = false;
  bool verbose = false;
};

/**
 * @brief Apply environment overrides to a configuration
 *
 * Reads MATHMARK_WORK_DIR, GROQ_API_KEY (or MATHMARK_API_KEY),
 * MATHMARK_VISION_URL, MATHMARK_VISION_MODEL, MATHMARK_PARSER_COMMAND and
 * TESSDATA_PREFIX. Unset variables leave the current value untouched.
 */
void applyEnvironment(PipelineConfig &config);

/// Parse "placeholder", "strip", "keep" or "fail"; returns false otherwise
bool parseUnresolvedPolicy(const std::string &text, UnresolvedPolicy &policy);

std::string toString(UnresolvedPolicy policy);

} // namespace mathmark

#endif // MATHMARK_PIPELINE_CONFIG_HPP
