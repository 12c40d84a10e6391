#include "mathmark/PipelineCoordinator.hpp"

#include <curl/curl.h>

#include <iostream>
#include <stdexcept>
#include <string>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path> [options]\n"
      << "\nOptions:\n"
      << "  -o, --work-dir <dir>       Artifact directory (default: data/work)\n"
      << "  --parser <poppler|command> Structural parser (default: poppler)\n"
      << "  --parser-command <cmd>     Converter command, with {input} and\n"
      << "                             {output_dir} placeholders\n"
      << "  --backend <openai|tesseract>\n"
      << "                             Formula transcription backend\n"
      << "  --model <name>             Vision model for the openai backend\n"
      << "  --scale <factor>           Region upscale factor (default: 4)\n"
      << "  --unresolved <policy>      placeholder, strip, keep or fail\n"
      << "  --threads <n>              Concurrent transcriptions (default: 4)\n"
      << "  --overlays                 Write cluster debug overlays\n"
      << "  --detect-only              Only report whether vector formulas "
         "exist\n"
      << "  -v, --verbose              Print debug output\n"
      << "  -h, --help                 Show this help message\n"
      << "\nEnvironment:\n"
      << "  GROQ_API_KEY, MATHMARK_API_KEY, MATHMARK_WORK_DIR,\n"
      << "  MATHMARK_VISION_URL, MATHMARK_VISION_MODEL,\n"
      << "  MATHMARK_PARSER_COMMAND, TESSDATA_PREFIX\n"
      << "\nExamples:\n"
      << "  " << programName << " paper.pdf\n"
      << "  " << programName << " paper.pdf --backend tesseract -v\n"
      << "  " << programName
      << " paper.pdf --parser command --unresolved strip\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string pdfPath;
  mathmark::PipelineConfig config;
  mathmark::applyEnvironment(config);
  bool detectOnly = false;

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      auto requireValue = [&](const std::string &option) -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(option + " requires an argument");
        }
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-o" || arg == "--work-dir") {
        config.workDir = requireValue("--work-dir");
      } else if (arg == "--parser") {
        std::string kind = requireValue("--parser");
        if (kind == "poppler") {
          config.parser.kind = mathmark::ParserConfig::Kind::PopplerText;
        } else if (kind == "command") {
          config.parser.kind = mathmark::ParserConfig::Kind::Command;
        } else {
          throw std::invalid_argument("unknown parser: " + kind);
        }
      } else if (arg == "--parser-command") {
        config.parser.command = requireValue("--parser-command");
        config.parser.kind = mathmark::ParserConfig::Kind::Command;
      } else if (arg == "--backend") {
        std::string backend = requireValue("--backend");
        if (backend == "openai") {
          config.vision.backend =
              mathmark::VisionConfig::Backend::OpenAICompatible;
        } else if (backend == "tesseract") {
          config.vision.backend = mathmark::VisionConfig::Backend::Tesseract;
        } else {
          throw std::invalid_argument("unknown backend: " + backend);
        }
      } else if (arg == "--model") {
        config.vision.model = requireValue("--model");
      } else if (arg == "--scale") {
        config.raster.scale = std::stod(requireValue("--scale"));
        if (config.raster.scale <= 0) {
          throw std::invalid_argument("--scale must be positive");
        }
      } else if (arg == "--unresolved") {
        std::string policy = requireValue("--unresolved");
        if (!mathmark::parseUnresolvedPolicy(policy,
                                             config.unresolvedPolicy)) {
          throw std::invalid_argument("unknown unresolved policy: " + policy);
        }
      } else if (arg == "--threads") {
        config.vision.maxConcurrency = std::stoi(requireValue("--threads"));
        if (config.vision.maxConcurrency < 1) {
          throw std::invalid_argument("--threads must be at least 1");
        }
      } else if (arg == "--overlays") {
        config.writeDebugOverlays = true;
      } else if (arg == "--detect-only") {
        detectOnly = true;
      } else if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
      } else if (arg[0] != '-') {
        pdfPath = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  curl_global_init(CURL_GLOBAL_ALL);
  int exitCode = 0;
  {
    mathmark::PipelineCoordinator coordinator(config);

    if (detectOnly) {
      bool found = coordinator.hasVectorFormulas(pdfPath);
      std::cout << pdfPath << ": "
                << (found ? "vector formulas found" : "no vector formulas")
                << "\n";
    } else {
      if (config.verbose) {
        std::cerr << "DEBUG: Work dir " << config.workDir << ", policy "
                  << mathmark::toString(config.unresolvedPolicy) << std::endl;
      }
      mathmark::ProcessResult result = coordinator.process(pdfPath);
      std::cout << mathmark::formatSummary(result);
      exitCode = result.success ? 0 : 1;
    }
  }
  curl_global_cleanup();

  return exitCode;
}
