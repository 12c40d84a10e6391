#include "mathmark/PipelineConfig.hpp"

#include <cstdlib>

namespace mathmark {

namespace {

bool readEnv(const char *name, std::string &target) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return false;
  }
  target = value;
  return true;
}

} // anonymous namespace

void applyEnvironment(PipelineConfig &config) {
  readEnv("MATHMARK_WORK_DIR", config.workDir);

  // Priority: MATHMARK_API_KEY over GROQ_API_KEY
  if (!readEnv("MATHMARK_API_KEY", config.vision.apiKey)) {
    readEnv("GROQ_API_KEY", config.vision.apiKey);
  }
  readEnv("MATHMARK_VISION_URL", config.vision.apiUrl);
  readEnv("MATHMARK_VISION_MODEL", config.vision.model);
  readEnv("TESSDATA_PREFIX", config.vision.tessDataPath);

  if (readEnv("MATHMARK_PARSER_COMMAND", config.parser.command)) {
    config.parser.kind = ParserConfig::Kind::Command;
  }
}

bool parseUnresolvedPolicy(const std::string &text, UnresolvedPolicy &policy) {
  if (text == "placeholder") {
    policy = UnresolvedPolicy::Placeholder;
  } else if (text == "strip") {
    policy = UnresolvedPolicy::Strip;
  } else if (text == "keep") {
    policy = UnresolvedPolicy::Keep;
  } else if (text == "fail") {
    policy = UnresolvedPolicy::Fail;
  } else {
    return false;
  }
  return true;
}

std::string toString(UnresolvedPolicy policy) {
  switch (policy) {
  case UnresolvedPolicy::Placeholder:
    return "placeholder";
  case UnresolvedPolicy::Strip:
    return "strip";
  case UnresolvedPolicy::Keep:
    return "keep";
  case UnresolvedPolicy::Fail:
    return "fail";
  }
  return "unknown";
}

} // namespace mathmark
