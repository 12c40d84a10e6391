#ifndef MATHMARK_LATEX_TRANSCRIBER_HPP
#define MATHMARK_LATEX_TRANSCRIBER_HPP

#include "mathmark/Concurrency.hpp"
#include "mathmark/PipelineConfig.hpp"
#include "mathmark/RegionRasterizer.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>

#include <memory>
#include <string>

namespace mathmark {

/**
 * @brief Result of transcribing one formula image
 */
struct TranscriptionResult {
  bool success = false;        ///< Whether a response was obtained
  std::string latex;           ///< Cleaned transcription
  std::string errorMessage;    ///< Error message if failed
  int attempts = 0;            ///< Requests made, retries included
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Turns a formula image into LaTeX
 *
 * Implementations are called concurrently from the resolver's worker pool
 * and must be thread-safe.
 */
class LatexTranscriber {
public:
  virtual ~LatexTranscriber() = default;

  virtual TranscriptionResult transcribe(const FormulaRegionImage &image) = 0;

  virtual std::string name() const = 0;
};

/// Instruction sent with every formula image
extern const char *const kFormulaPrompt;

/**
 * @brief Strip the usual wrapping from a model response
 *
 * Removes ```latex / ``` fences, surrounding $ delimiters and whitespace.
 */
std::string cleanLatexResponse(const std::string &raw);

/// Standard base64 with padding
std::string encodeBase64(const std::string &data);

/**
 * @brief Client for an OpenAI-compatible chat-completions endpoint
 *
 * The image is sent inline as a base64 PNG data URL. HTTP 429 and 5xx are
 * retried with exponential backoff up to VisionConfig::maxAttempts; every
 * request first passes the shared rate limiter.
 */
class OpenAICompatibleTranscriber : public LatexTranscriber {
public:
  explicit OpenAICompatibleTranscriber(const VisionConfig &config);

  TranscriptionResult transcribe(const FormulaRegionImage &image) override;
  std::string name() const override { return "openai-compatible"; }

  /// Request body for one image
  static nlohmann::json buildRequest(const std::string &model, int maxTokens,
                                     const std::string &pngBase64);

  /**
   * @brief Message content of a chat-completions response
   * @return false with errorMessage set if the response has no content
   */
  static bool extractContent(const nlohmann::json &response,
                             std::string &content, std::string &errorMessage);

private:
  void requestLatex(const FormulaRegionImage &image,
                    TranscriptionResult &result);
  bool post(const std::string &body, std::string &response, long &httpCode,
            std::string &errorMessage) const;

  VisionConfig m_config;
  RateLimiter m_limiter;
};

/**
 * @brief Offline transcription with Tesseract
 *
 * Produces the recognized text of the region, not true LaTeX. Each call
 * creates its own engine so calls may run in parallel.
 */
class TesseractTranscriber : public LatexTranscriber {
public:
  explicit TesseractTranscriber(const VisionConfig &config);

  TranscriptionResult transcribe(const FormulaRegionImage &image) override;
  std::string name() const override { return "tesseract"; }

  /// Greyscale, blur and adaptive threshold
  static cv::Mat preprocessImage(const cv::Mat &image);

private:
  void recognize(const FormulaRegionImage &image,
                 TranscriptionResult &result) const;
  std::string resolveTessDataPath() const;

  VisionConfig m_config;
};

/// Transcriber selected by the configuration
std::unique_ptr<LatexTranscriber> createTranscriber(const VisionConfig &config);

} // namespace mathmark

#endif // MATHMARK_LATEX_TRANSCRIBER_HPP
