#include "mathmark/LatexTranscriber.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

#include <curl/curl.h>
#include <tesseract/baseapi.h>

namespace mathmark {

const char *const kFormulaPrompt =
    "This image contains a mathematical formula or equation from a technical "
    "document.\n\n"
    "Extract the COMPLETE LaTeX representation of this formula.\n"
    "Be precise - include ALL:\n"
    "- Fractions (\\frac{}{})\n"
    "- Subscripts and superscripts\n"
    "- Greek letters (\\alpha, \\beta, etc.)\n"
    "- Special symbols (\\cdot, \\times, \\sum, \\int, etc.)\n"
    "- Parentheses and brackets\n\n"
    "Respond with ONLY the LaTeX code, nothing else. Do not wrap in $$ or "
    "code blocks.";

namespace {

std::string trim(const std::string &text) {
  const char *whitespace = " \t\r\n";
  size_t start = text.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return std::string();
  }
  size_t end = text.find_last_not_of(whitespace);
  return text.substr(start, end - start + 1);
}

void eraseAll(std::string &text, const std::string &token) {
  size_t pos;
  while ((pos = text.find(token)) != std::string::npos) {
    text.erase(pos, token.size());
  }
}

size_t curlWriteCallback(void *contents, size_t size, size_t nmemb,
                         void *userp) {
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            size * nmemb);
  return size * nmemb;
}

bool readBinaryFile(const std::string &path, std::string &data) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream content;
  content << in.rdbuf();
  data = content.str();
  return true;
}

} // anonymous namespace

std::string cleanLatexResponse(const std::string &raw) {
  std::string latex = trim(raw);
  eraseAll(latex, "```latex");
  eraseAll(latex, "```");
  latex = trim(latex);

  size_t start = latex.find_first_not_of('$');
  if (start == std::string::npos) {
    return std::string();
  }
  size_t end = latex.find_last_not_of('$');
  return trim(latex.substr(start, end - start + 1));
}

std::string encodeBase64(const std::string &data) {
  static const char alphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string encoded;
  encoded.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    unsigned int triple = (static_cast<unsigned char>(data[i]) << 16) |
                          (static_cast<unsigned char>(data[i + 1]) << 8) |
                          static_cast<unsigned char>(data[i + 2]);
    encoded += alphabet[(triple >> 18) & 0x3F];
    encoded += alphabet[(triple >> 12) & 0x3F];
    encoded += alphabet[(triple >> 6) & 0x3F];
    encoded += alphabet[triple & 0x3F];
  }

  size_t remaining = data.size() - i;
  if (remaining > 0) {
    unsigned int triple = static_cast<unsigned char>(data[i]) << 16;
    if (remaining == 2) {
      triple |= static_cast<unsigned char>(data[i + 1]) << 8;
    }
    encoded += alphabet[(triple >> 18) & 0x3F];
    encoded += alphabet[(triple >> 12) & 0x3F];
    encoded += remaining == 2 ? alphabet[(triple >> 6) & 0x3F] : '=';
    encoded += '=';
  }
  return encoded;
}

// OpenAI-compatible backend

OpenAICompatibleTranscriber::OpenAICompatibleTranscriber(
    const VisionConfig &config)
    : m_config(config), m_limiter(config.requestsPerSecond) {}

nlohmann::json
OpenAICompatibleTranscriber::buildRequest(const std::string &model,
                                          int maxTokens,
                                          const std::string &pngBase64) {
  nlohmann::json content = nlohmann::json::array();
  content.push_back({{"type", "text"}, {"text", kFormulaPrompt}});
  content.push_back(
      {{"type", "image_url"},
       {"image_url", {{"url", "data:image/png;base64," + pngBase64}}}});

  nlohmann::json request;
  request["model"] = model;
  request["temperature"] = 0.0;
  request["max_tokens"] = maxTokens;
  nlohmann::json message;
  message["role"] = "user";
  message["content"] = content;
  request["messages"] = nlohmann::json::array();
  request["messages"].push_back(message);
  return request;
}

bool OpenAICompatibleTranscriber::extractContent(
    const nlohmann::json &response, std::string &content,
    std::string &errorMessage) {
  if (response.contains("error")) {
    const auto &error = response["error"];
    if (error.is_object() && error.contains("message") &&
        error["message"].is_string()) {
      errorMessage = "API error: " + error["message"].get<std::string>();
    } else {
      errorMessage = "API error: " + error.dump();
    }
    return false;
  }

  if (!response.contains("choices") || !response["choices"].is_array() ||
      response["choices"].empty()) {
    errorMessage = "Response has no choices";
    return false;
  }

  const auto &message = response["choices"][0].value("message", nlohmann::json());
  if (!message.is_object() || !message.contains("content") ||
      !message["content"].is_string()) {
    errorMessage = "Response has no message content";
    return false;
  }

  content = message["content"].get<std::string>();
  return true;
}

bool OpenAICompatibleTranscriber::post(const std::string &body,
                                       std::string &response, long &httpCode,
                                       std::string &errorMessage) const {
  CURL *curl = curl_easy_init();
  if (!curl) {
    errorMessage = "curl init failed";
    return false;
  }

  struct curl_slist *headers = nullptr;
  std::string auth = "Authorization: Bearer " + m_config.apiKey;
  headers = curl_slist_append(headers, auth.c_str());
  headers = curl_slist_append(headers, "Content-Type: application/json");

  curl_easy_setopt(curl, CURLOPT_URL, m_config.apiUrl.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                   static_cast<long>(m_config.timeoutSeconds));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // required with threads
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

  CURLcode res = curl_easy_perform(curl);
  httpCode = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    errorMessage = res == CURLE_OPERATION_TIMEDOUT
                       ? "Request timed out"
                       : std::string("curl failed: ") + curl_easy_strerror(res);
    return false;
  }
  return true;
}

void OpenAICompatibleTranscriber::requestLatex(const FormulaRegionImage &image,
                                               TranscriptionResult &result) {
  if (m_config.apiKey.empty()) {
    result.errorMessage = "No API key configured";
    return;
  }

  std::string png;
  if (!readBinaryFile(image.path, png)) {
    result.errorMessage = "Failed to read image: " + image.path;
    return;
  }

  std::string body =
      buildRequest(m_config.model, m_config.maxTokens, encodeBase64(png))
          .dump();

  std::string response;
  long httpCode = 0;
  int backoffMs = 400;
  int maxAttempts = std::max(1, m_config.maxAttempts);
  while (result.attempts < maxAttempts) {
    m_limiter.wait();
    result.attempts++;
    response.clear();
    if (!post(body, response, httpCode, result.errorMessage)) {
      return;
    }
    if ((httpCode == 429 || httpCode >= 500) &&
        result.attempts < maxAttempts) {
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
      backoffMs = std::min(5000, backoffMs * 2);
      continue;
    }
    break;
  }

  nlohmann::json parsed =
      nlohmann::json::parse(response.empty() ? "{}" : response, nullptr,
                            false);
  if (parsed.is_discarded()) {
    result.errorMessage =
        "Invalid JSON response (HTTP " + std::to_string(httpCode) + ")";
    return;
  }

  std::string content;
  if (!extractContent(parsed, content, result.errorMessage)) {
    if (httpCode >= 400) {
      result.errorMessage += " (HTTP " + std::to_string(httpCode) + ")";
    }
    return;
  }
  if (httpCode >= 400) {
    result.errorMessage = "HTTP " + std::to_string(httpCode);
    return;
  }

  result.latex = cleanLatexResponse(content);
  result.success = true;
}

TranscriptionResult
OpenAICompatibleTranscriber::transcribe(const FormulaRegionImage &image) {
  TranscriptionResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    requestLatex(image, result);
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Transcription failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

// Tesseract backend

TesseractTranscriber::TesseractTranscriber(const VisionConfig &config)
    : m_config(config) {}

std::string TesseractTranscriber::resolveTessDataPath() const {
  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    return m_config.tessDataPath;
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  const char *envPath = std::getenv("TESSDATA_PREFIX");
  if (envPath != nullptr) {
    return envPath;
  }
  // Priority 3: Tesseract's compiled-in location
  return std::string();
}

cv::Mat TesseractTranscriber::preprocessImage(const cv::Mat &image) {
  cv::Mat processed;

  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);
  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);
  return processed;
}

void TesseractTranscriber::recognize(const FormulaRegionImage &image,
                                     TranscriptionResult &result) const {
  cv::Mat loaded = cv::imread(image.path);
  if (loaded.empty()) {
    result.errorMessage = "Failed to load image: " + image.path;
    return;
  }

  std::string tessDataPath = resolveTessDataPath();
  tesseract::TessBaseAPI engine;
  if (engine.Init(tessDataPath.empty() ? nullptr : tessDataPath.c_str(),
                  m_config.language.c_str()) != 0) {
    result.errorMessage =
        "Failed to initialize Tesseract with language: " + m_config.language;
    return;
  }
  engine.SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);

  // Tesseract expects RGB
  cv::Mat rgbImage;
  cv::cvtColor(preprocessImage(loaded), rgbImage, cv::COLOR_GRAY2RGB);
  engine.SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                  static_cast<int>(rgbImage.step));

  char *outText = engine.GetUTF8Text();
  std::string text;
  if (outText) {
    text = outText;
    delete[] outText;
  }
  engine.End();

  // One formula per region; fold line breaks
  std::replace(text.begin(), text.end(), '\n', ' ');
  result.latex = cleanLatexResponse(text);
  result.success = true;
}

TranscriptionResult
TesseractTranscriber::transcribe(const FormulaRegionImage &image) {
  TranscriptionResult result;
  result.success = false;
  result.attempts = 1;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    recognize(image, result);
  } catch (const std::exception &e) {
    result.errorMessage = std::string("OCR transcription failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

std::unique_ptr<LatexTranscriber>
createTranscriber(const VisionConfig &config) {
  if (config.backend == VisionConfig::Backend::Tesseract) {
    return std::make_unique<TesseractTranscriber>(config);
  }
  if (config.apiKey.empty()) {
    std::cerr << "No API key configured, falling back to Tesseract"
              << std::endl;
    return std::make_unique<TesseractTranscriber>(config);
  }
  return std::make_unique<OpenAICompatibleTranscriber>(config);
}

} // namespace mathmark
