#include "TestPages.hpp"
#include "TestPdf.hpp"
#include "mathmark/Concurrency.hpp"
#include "mathmark/DebugOverlay.hpp"
#include "mathmark/PipelineCoordinator.hpp"
#include "mathmark/VectorPageReader.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace mathmark;
using namespace mathmark::testing;

namespace {

class FixedTranscriber : public LatexTranscriber {
public:
  explicit FixedTranscriber(std::string latex) : m_latex(std::move(latex)) {}

  TranscriptionResult transcribe(const FormulaRegionImage &image) override {
    TranscriptionResult result;
    result.attempts = 1;
    if (image.width <= 0 || image.height <= 0) {
      result.errorMessage = "empty image";
      return result;
    }
    result.latex = m_latex;
    result.success = true;
    return result;
  }

  std::string name() const override { return "fixed"; }

private:
  std::string m_latex;
};

// Returns canned markdown regardless of the input document
class CannedParser : public StructuralParser {
public:
  explicit CannedParser(std::string markdown)
      : m_markdown(std::move(markdown)) {}

  ParsedDocument parse(const std::string &pdfPath,
                       const std::string & /*outputDir*/) override {
    lastInput = pdfPath;
    ParsedDocument document;
    document.markdown = m_markdown;
    document.success = true;
    return document;
  }

  std::string name() const override { return "canned"; }

  std::string lastInput;

private:
  std::string m_markdown;
};

std::string readBytes(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    root = std::filesystem::temp_directory_path() / "mathmark_pipeline_test";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
    config.workDir = (root / "work").string();
    config.vision.maxConcurrency = 2;
  }

  void TearDown() override { std::filesystem::remove_all(root); }

  std::string writeFormulaPdf(const std::string &name) {
    std::string path = (root / (name + ".pdf")).string();
    EXPECT_TRUE(writeSinglePagePdf(
        path, textContent(72, 402, "Energy is") + formulaContent(140, 400, 6)));
    return path;
  }

  std::filesystem::path root;
  PipelineConfig config;
};

TEST_F(PipelineTest, ReaderFindsFormulaPrimitives) {
  PageReadResult read = readPages(writeFormulaPdf("reader"));
  ASSERT_TRUE(read.success) << read.errorMessage;
  ASSERT_EQ(read.pages.size(), 1u);

  const Page &page = read.pages[0];
  EXPECT_NEAR(page.width, 612, 1e-6);
  EXPECT_NEAR(page.height, 792, 1e-6);
  ASSERT_EQ(page.primitives.size(), 6u); // text is not recorded
  EXPECT_TRUE(page.primitives[0].hasCurves);
  EXPECT_TRUE(page.primitives[0].filled);
  EXPECT_NEAR(page.primitives[0].bbox.x0, 140, 0.5);
  EXPECT_NEAR(page.primitives[0].bbox.y0, 378, 0.5); // 792 - 414
}

TEST_F(PipelineTest, EndToEndWithTextLayerParser) {
  PipelineCoordinator coordinator(config, std::make_unique<PopplerTextParser>(),
                                  std::make_unique<FixedTranscriber>("x^2"));

  std::string pdf = writeFormulaPdf("paper");
  std::string original = readBytes(pdf);
  ProcessResult result = coordinator.process(pdf);
  ASSERT_TRUE(result.success) << result.errorMessage;

  EXPECT_EQ(result.documentName, "paper");
  ASSERT_EQ(result.candidates.size(), 1u);
  EXPECT_EQ(result.candidates[0].marker, "##FORMULA_001##");
  EXPECT_EQ(result.summary.resolved, 1);
  EXPECT_NE(result.finalMarkdown.find("Energy"), std::string::npos);
  EXPECT_NE(result.finalMarkdown.find("$$x^2$$"), std::string::npos);
  EXPECT_EQ(result.finalMarkdown.find("FORMULA"), std::string::npos);

  std::filesystem::path documentDir = root / "work" / "paper";
  EXPECT_TRUE(std::filesystem::exists(documentDir / "paper.md"));
  EXPECT_TRUE(std::filesystem::exists(documentDir / "paper_marked.pdf"));

  // Markers go into a copy; the source keeps its bytes
  EXPECT_EQ(readBytes(pdf), original);

  // Region image is (bbox + 2 x margin) x scale
  cv::Mat region = cv::imread(
      (documentDir / "formulas" / "formula_001_page_001.png").string());
  ASSERT_FALSE(region.empty());
  const BoundingBox &bbox = result.candidates[0].bbox;
  double padding = 2 * config.raster.margin;
  EXPECT_NEAR(region.cols,
              std::lround((bbox.width() + padding) * config.raster.scale), 1);
  EXPECT_NEAR(region.rows,
              std::lround((bbox.height() + padding) * config.raster.scale), 1);
}

TEST_F(PipelineTest, RepeatedRunsGiveIdenticalOutput) {
  std::string pdf = writeFormulaPdf("repeat");
  PipelineCoordinator coordinator(
      config, std::make_unique<CannedParser>("Energy is ##FORMULA_001##\n"),
      std::make_unique<FixedTranscriber>("E"));

  ProcessResult first = coordinator.process(pdf);
  ProcessResult second = coordinator.process(pdf);
  ASSERT_TRUE(first.success) << first.errorMessage;
  ASSERT_TRUE(second.success) << second.errorMessage;
  EXPECT_EQ(first.finalMarkdown, "Energy is $$E$$\n");
  EXPECT_EQ(first.finalMarkdown, second.finalMarkdown);

  std::ifstream in(second.outputPath);
  std::string written((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(written, second.finalMarkdown);
}

TEST_F(PipelineTest, LostMarkerIsReportedNotFatal) {
  auto parser = std::make_unique<CannedParser>("Energy is\n");
  PipelineCoordinator coordinator(config, std::move(parser),
                                  std::make_unique<FixedTranscriber>("E"));

  ProcessResult result = coordinator.process(writeFormulaPdf("lost"));
  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.summary.skipped, 1);
  ASSERT_FALSE(result.warnings.empty());
  EXPECT_NE(formatSummary(result).find("marker lost in structural parsing"),
            std::string::npos);
}

TEST_F(PipelineTest, FailPolicyFailsTheDocument) {
  config.unresolvedPolicy = UnresolvedPolicy::Fail;
  PipelineCoordinator coordinator(config,
                                  std::make_unique<CannedParser>("Energy is\n"),
                                  std::make_unique<FixedTranscriber>("E"));

  ProcessResult result = coordinator.process(writeFormulaPdf("strict"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorMessage, "1 formula(s) could not be resolved");
  EXPECT_GT(result.processingTimeMs, 0.0);
  EXPECT_FALSE(
      std::filesystem::exists(root / "work" / "strict" / "strict.md"));
}

TEST_F(PipelineTest, LeakedMarkerFailsTheDocument) {
  // A marker the detector never issued survives substitution
  PipelineCoordinator coordinator(
      config,
      std::make_unique<CannedParser>("##FORMULA_001## ##FORMULA_042##\n"),
      std::make_unique<FixedTranscriber>("E"));

  ProcessResult result = coordinator.process(writeFormulaPdf("leak"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.leakedMarkerIds, std::vector<int>{42});
  EXPECT_GT(result.processingTimeMs, 0.0);
  EXPECT_GT(result.summary.readMs, 0.0);
  EXPECT_EQ(result.report.unknownMarkerIds, std::vector<int>{42});
}

TEST_F(PipelineTest, DocumentWithoutFormulasIsParsedDirectly) {
  std::string pdf = (root / "plain.pdf").string();
  ASSERT_TRUE(writeSinglePagePdf(pdf, textContent(72, 700, "Only text")));

  auto parser = std::make_unique<CannedParser>("Only text\n");
  CannedParser *parserView = parser.get();
  PipelineCoordinator coordinator(config, std::move(parser),
                                  std::make_unique<FixedTranscriber>("E"));

  EXPECT_FALSE(coordinator.hasVectorFormulas(pdf));
  ProcessResult result = coordinator.process(pdf);
  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_TRUE(result.candidates.empty());
  EXPECT_TRUE(result.markedPdfPath.empty());
  EXPECT_EQ(parserView->lastInput, pdf);
  EXPECT_EQ(result.finalMarkdown, "Only text\n");
}

TEST_F(PipelineTest, QuickCheckFindsFormulas) {
  PipelineCoordinator coordinator(config,
                                  std::make_unique<CannedParser>("x\n"),
                                  std::make_unique<FixedTranscriber>("E"));
  EXPECT_TRUE(coordinator.hasVectorFormulas(writeFormulaPdf("quick")));
  EXPECT_FALSE(coordinator.hasVectorFormulas((root / "absent.pdf").string()));
}

TEST_F(PipelineTest, MissingPdfFailsGracefully) {
  PipelineCoordinator coordinator(config,
                                  std::make_unique<CannedParser>("x\n"),
                                  std::make_unique<FixedTranscriber>("E"));
  ProcessResult result = coordinator.process((root / "missing.pdf").string());
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.errorMessage.empty());
  EXPECT_EQ(result.documentName, "missing");
  EXPECT_NE(formatSummary(result).find("Status: FAILED"), std::string::npos);
}

TEST(DetectCandidatesTest, IdsFollowPageThenReadingOrder) {
  std::vector<Page> pages;
  for (int i = 0; i < 3; i++) {
    Page page = letterPage(i);
    addFormula(page, 300, 500, 4);
    addFormula(page, 100, 200, 4);
    pages.push_back(page);
  }

  MarkerProtocol protocol;
  CandidateIdCounter counter;
  DetectionResult detection = PipelineCoordinator::detectCandidates(
      pages, ClusterConfig(), 4, protocol, counter);

  ASSERT_EQ(detection.candidates.size(), 6u);
  for (size_t i = 0; i < detection.candidates.size(); i++) {
    const FormulaCandidate &candidate = detection.candidates[i];
    EXPECT_EQ(candidate.id, static_cast<int>(i) + 1);
    EXPECT_EQ(candidate.pageIndex, static_cast<int>(i) / 2);
    EXPECT_EQ(candidate.marker, protocol.format(candidate.id));
    EXPECT_EQ(candidate.primitiveCount, 4);
  }
  EXPECT_DOUBLE_EQ(detection.candidates[0].bbox.y0, 200);
  EXPECT_DOUBLE_EQ(detection.candidates[1].bbox.y0, 500);
  EXPECT_EQ(counter.peek(), 7);
  EXPECT_EQ(detection.clusterCount, 6);
  ASSERT_EQ(detection.pageClusters.size(), 3u);
  EXPECT_EQ(detection.pageClusters[2][1].candidateId, 6);
}

TEST(DetectCandidatesTest, NumberingIndependentOfThreadCount) {
  std::vector<Page> pages;
  for (int i = 0; i < 8; i++) {
    Page page = letterPage(i);
    for (int f = 0; f <= i % 3; f++) {
      addFormula(page, 100, 100 + f * 100.0, 3 + f);
    }
    page.primitives.push_back(horizontalRule(72, 540, 770)); // footer
    pages.push_back(page);
  }

  MarkerProtocol protocol;
  CandidateIdCounter sequentialCounter;
  CandidateIdCounter parallelCounter;
  DetectionResult sequential = PipelineCoordinator::detectCandidates(
      pages, ClusterConfig(), 1, protocol, sequentialCounter);
  DetectionResult parallel = PipelineCoordinator::detectCandidates(
      pages, ClusterConfig(), 8, protocol, parallelCounter);

  ASSERT_EQ(sequential.candidates.size(), parallel.candidates.size());
  for (size_t i = 0; i < sequential.candidates.size(); i++) {
    EXPECT_EQ(sequential.candidates[i].id, parallel.candidates[i].id);
    EXPECT_EQ(sequential.candidates[i].pageIndex,
              parallel.candidates[i].pageIndex);
    EXPECT_EQ(sequential.candidates[i].bbox, parallel.candidates[i].bbox);
  }
  EXPECT_EQ(sequential.rejected, parallel.rejected);
  EXPECT_EQ(sequential.rejected[RejectionReason::HeaderFooterZone], 8);
}

TEST(DocumentLockRegistryTest, OneEntryPerDistinctName) {
  DocumentLockRegistry registry;
  for (int i = 0; i < 3; i++) {
    std::unique_lock<std::mutex> lock = registry.lock("paper");
  }
  { std::unique_lock<std::mutex> lock = registry.lock("notes"); }
  EXPECT_EQ(registry.size(), 2u);
}

TEST(DocumentLockRegistryTest, SameNameRunsAreSerialized) {
  DocumentLockRegistry registry;
  std::atomic<bool> acquired{false};

  std::unique_lock<std::mutex> held = registry.lock("paper");
  std::thread other([&]() {
    std::unique_lock<std::mutex> lock = registry.lock("paper");
    acquired = true;
  });

  // A different name is not blocked
  {
    std::unique_lock<std::mutex> unrelated = registry.lock("thesis");
    EXPECT_TRUE(unrelated.owns_lock());
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  held.unlock();
  other.join();
  EXPECT_TRUE(acquired.load());
}

TEST(PipelineCoordinatorTest, DocumentNameIsFileStem) {
  EXPECT_EQ(PipelineCoordinator::documentName("/data/in/paper.pdf"), "paper");
  EXPECT_EQ(PipelineCoordinator::documentName("notes.v2.pdf"), "notes.v2");
}

TEST(PipelineCoordinatorTest, SummaryListsUnresolvedAndRejected) {
  ProcessResult result;
  result.success = true;
  result.documentName = "paper";
  result.summary.pages = 2;
  result.summary.clusters = 5;
  result.summary.candidates = 2;
  result.summary.resolved = 1;
  result.summary.failed = 1;
  result.summary.rejected[RejectionReason::TableLike] = 3;

  ResolvedFormula failed;
  failed.candidateId = 2;
  failed.pageIndex = 1;
  failed.marker = "##FORMULA_002##";
  failed.status = ResolutionStatus::Failed;
  failed.reason = "Request timed out";
  result.report.entries.push_back(failed);

  std::string summary = formatSummary(result);
  EXPECT_NE(summary.find("Document: paper"), std::string::npos);
  EXPECT_NE(summary.find("Status: OK"), std::string::npos);
  EXPECT_NE(summary.find("Formula candidates: 2"), std::string::npos);
  EXPECT_NE(summary.find("##FORMULA_002## (page 2) failed: Request timed out"),
            std::string::npos);
  EXPECT_NE(summary.find("table-like: 3"), std::string::npos);
}

TEST(PipelineConfigTest, UnresolvedPolicyNames) {
  UnresolvedPolicy policy = UnresolvedPolicy::Placeholder;
  for (const char *name : {"placeholder", "strip", "keep", "fail"}) {
    ASSERT_TRUE(parseUnresolvedPolicy(name, policy)) << name;
    EXPECT_EQ(toString(policy), name);
  }
  EXPECT_FALSE(parseUnresolvedPolicy("drop", policy));
  EXPECT_EQ(policy, UnresolvedPolicy::Fail);
}

TEST(PipelineConfigTest, EnvironmentOverrides) {
  setenv("MATHMARK_WORK_DIR", "/tmp/mathmark-env", 1);
  setenv("GROQ_API_KEY", "groq-key", 1);
  setenv("MATHMARK_API_KEY", "own-key", 1);
  setenv("MATHMARK_PARSER_COMMAND", "convert {input}", 1);
  unsetenv("MATHMARK_VISION_MODEL");

  PipelineConfig config;
  std::string defaultModel = config.vision.model;
  applyEnvironment(config);
  EXPECT_EQ(config.workDir, "/tmp/mathmark-env");
  EXPECT_EQ(config.vision.apiKey, "own-key");
  EXPECT_EQ(config.vision.model, defaultModel);
  EXPECT_EQ(config.parser.kind, ParserConfig::Kind::Command);
  EXPECT_EQ(config.parser.command, "convert {input}");

  unsetenv("MATHMARK_API_KEY");
  PipelineConfig fallback;
  applyEnvironment(fallback);
  EXPECT_EQ(fallback.vision.apiKey, "groq-key");

  unsetenv("MATHMARK_WORK_DIR");
  unsetenv("GROQ_API_KEY");
  unsetenv("MATHMARK_PARSER_COMMAND");
}

TEST(ConcurrencyTest, ParallelForVisitsEveryIndexOnce) {
  std::vector<std::atomic<int>> visits(200);
  for (auto &v : visits) {
    v = 0;
  }
  parallelFor(visits.size(), 6, [&](size_t i) { visits[i]++; });
  for (const auto &v : visits) {
    EXPECT_EQ(v.load(), 1);
  }
}

TEST(ConcurrencyTest, ParallelForRethrowsAfterFinishing) {
  std::atomic<int> ran{0};
  EXPECT_THROW(parallelFor(50, 4,
                           [&](size_t i) {
                             ran++;
                             if (i == 7) {
                               throw std::runtime_error("bad index");
                             }
                           }),
               std::runtime_error);
  EXPECT_EQ(ran.load(), 50);
}

TEST(ConcurrencyTest, RateLimiterSpacesRequests) {
  RateLimiter limiter(50.0); // 20ms apart
  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 5; i++) {
    limiter.wait();
  }
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(75));

  RateLimiter unlimited(0);
  start = std::chrono::steady_clock::now();
  for (int i = 0; i < 100; i++) {
    unlimited.wait();
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(50));
}

TEST(DebugOverlayTest, UnwritableDirectoryFails) {
  std::filesystem::path blocker =
      std::filesystem::temp_directory_path() / "mathmark_overlay_blocker";
  std::filesystem::remove_all(blocker);
  {
    std::ofstream out(blocker);
    out << "not a directory";
  }

  Page page = letterPage();
  addFormula(page, 100, 100, 4);
  OverlayCluster cluster;
  cluster.bbox = BoundingBox(100, 100, 160, 114);
  cluster.candidateId = 1;

  OverlayResult result = writeClusterOverlay(
      page, {cluster}, (blocker / "overlays" / "page_1_clusters.png").string());
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.errorMessage.empty());

  std::filesystem::remove(blocker);
}
