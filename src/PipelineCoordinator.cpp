#include "mathmark/PipelineCoordinator.hpp"

#include "mathmark/Concurrency.hpp"
#include "mathmark/GeometryClusterer.hpp"
#include "mathmark/MarkerInjector.hpp"
#include "mathmark/RegionRasterizer.hpp"
#include "mathmark/VectorPageReader.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mathmark {

namespace {

double elapsedMs(std::chrono::high_resolution_clock::time_point start) {
  auto now = std::chrono::high_resolution_clock::now();
  return std::chrono::duration<double, std::milli>(now - start).count();
}

} // anonymous namespace

std::unique_lock<std::mutex>
DocumentLockRegistry::lock(const std::string &documentName) {
  std::mutex *documentMutex = nullptr;
  {
    std::lock_guard<std::mutex> guard(m_mutex);
    auto &slot = m_locks[documentName];
    if (!slot) {
      slot = std::make_unique<std::mutex>();
    }
    documentMutex = slot.get();
  }
  return std::unique_lock<std::mutex>(*documentMutex);
}

size_t DocumentLockRegistry::size() const {
  std::lock_guard<std::mutex> guard(m_mutex);
  return m_locks.size();
}

DocumentLockRegistry &DocumentLockRegistry::global() {
  static DocumentLockRegistry registry;
  return registry;
}

std::string formatSummary(const ProcessResult &result) {
  const ProcessingSummary &summary = result.summary;
  std::ostringstream out;
  out << "Document: " << result.documentName << "\n";
  out << "  Status: " << (result.success ? "OK" : "FAILED") << "\n";
  if (!result.errorMessage.empty()) {
    out << "  Error: " << result.errorMessage << "\n";
  }
  out << "  Pages: " << summary.pages << ", clusters: " << summary.clusters
      << "\n";
  out << "  Formula candidates: " << summary.candidates << "\n";
  out << "    resolved: " << summary.resolved << "\n";
  out << "    failed:   " << summary.failed << "\n";
  out << "    skipped:  " << summary.skipped << "\n";
  if (summary.markersRepaired > 0) {
    out << "  Markers repaired: " << summary.markersRepaired << "\n";
  }

  for (const auto &entry : result.report.entries) {
    if (entry.status == ResolutionStatus::Resolved)
      continue;
    out << "    " << entry.marker << " (page " << (entry.pageIndex + 1)
        << ") " << toString(entry.status) << ": " << entry.reason << "\n";
  }

  if (!summary.rejected.empty()) {
    out << "  Rejected clusters:\n";
    for (const auto &entry : summary.rejected) {
      out << "    " << toString(entry.first) << ": " << entry.second << "\n";
    }
  }
  for (const auto &warning : result.warnings) {
    out << "  Warning: " << warning << "\n";
  }

  out << std::fixed << std::setprecision(1);
  out << "  Timings (ms): read " << summary.readMs << ", cluster "
      << summary.clusterMs << ", raster " << summary.rasterMs << ", inject "
      << summary.injectMs << ", parse " << summary.parseMs << ", resolve "
      << summary.resolveMs << ", total " << result.processingTimeMs << "\n";
  if (!result.outputPath.empty()) {
    out << "  Output: " << result.outputPath << "\n";
  }
  return out.str();
}

PipelineCoordinator::PipelineCoordinator(const PipelineConfig &config)
    : m_config(config), m_protocol(),
      m_parser(createStructuralParser(config.parser)),
      m_transcriber(createTranscriber(config.vision)) {}

PipelineCoordinator::PipelineCoordinator(
    const PipelineConfig &config, std::unique_ptr<StructuralParser> parser,
    std::unique_ptr<LatexTranscriber> transcriber)
    : m_config(config), m_protocol(), m_parser(std::move(parser)),
      m_transcriber(std::move(transcriber)) {}

std::string PipelineCoordinator::documentName(const std::string &pdfPath) {
  return std::filesystem::path(pdfPath).stem().string();
}

DetectionResult PipelineCoordinator::detectCandidates(
    const std::vector<Page> &pages, const ClusterConfig &config, int threads,
    const MarkerProtocol &protocol, CandidateIdCounter &counter) {
  DetectionResult detection;
  GeometryClusterer clusterer(config);

  std::vector<std::vector<VectorCluster>> clusters(pages.size());
  std::vector<std::vector<RejectionReason>> decisions(pages.size());

  // Pure per page; ids are handed out afterwards
  parallelFor(pages.size(), threads, [&](size_t i) {
    clusters[i] = clusterer.clusterPage(pages[i]);
    for (const auto &cluster : clusters[i]) {
      decisions[i].push_back(clusterer.classify(cluster, pages[i]));
    }
  });

  detection.pageClusters.resize(pages.size());
  for (size_t i = 0; i < pages.size(); i++) {
    for (size_t c = 0; c < clusters[i].size(); c++) {
      const VectorCluster &cluster = clusters[i][c];
      RejectionReason reason = decisions[i][c];
      detection.clusterCount++;

      OverlayCluster overlay;
      overlay.bbox = cluster.bbox;
      overlay.reason = reason;

      if (reason == RejectionReason::None) {
        FormulaCandidate candidate;
        candidate.id = counter.next();
        candidate.pageIndex = pages[i].index;
        candidate.bbox = cluster.bbox;
        candidate.primitiveCount = cluster.primitiveCount();
        candidate.marker = protocol.format(candidate.id);
        detection.candidates.push_back(candidate);
        overlay.candidateId = candidate.id;
      } else {
        detection.rejected[reason]++;
      }
      detection.pageClusters[i].push_back(overlay);
    }
  }
  return detection;
}

bool PipelineCoordinator::hasVectorFormulas(const std::string &pdfPath) const {
  PageReadResult read = readPages(pdfPath, m_config.detectionSamplePages);
  if (!read.success) {
    std::cerr << "Quick check failed: " << read.errorMessage << std::endl;
    return false;
  }

  GeometryClusterer clusterer(m_config.cluster);
  for (const auto &page : read.pages) {
    for (const auto &cluster : clusterer.clusterPage(page)) {
      if (clusterer.isFormulaLike(cluster, page))
        return true;
    }
  }
  return false;
}

void PipelineCoordinator::runStages(const std::string &pdfPath,
                                    ProcessResult &result) {
  ProcessingSummary &summary = result.summary;
  const bool verbose = m_config.verbose;

  if (!m_parser || !m_transcriber) {
    result.errorMessage = "Pipeline is missing a parser or transcriber";
    return;
  }

  std::string protocolError;
  if (!m_protocol.verify(&protocolError)) {
    result.errorMessage = "Invalid marker format: " + protocolError;
    return;
  }

  namespace fs = std::filesystem;
  fs::path documentDir = fs::path(m_config.workDir) / result.documentName;
  fs::path formulasDir = documentDir / "formulas";
  fs::create_directories(documentDir);
  // Images from an earlier run would not match the new ids
  fs::remove_all(formulasDir);
  fs::create_directories(formulasDir);

  std::cerr << "Processing " << pdfPath << std::endl;

  // Vector pages
  auto stageStart = std::chrono::high_resolution_clock::now();
  PageReadResult read = readPages(pdfPath);
  summary.readMs = elapsedMs(stageStart);
  if (!read.success) {
    result.errorMessage = read.errorMessage;
    return;
  }
  summary.pages = static_cast<int>(read.pages.size());

  // Clusters and candidates
  stageStart = std::chrono::high_resolution_clock::now();
  CandidateIdCounter counter;
  DetectionResult detection =
      detectCandidates(read.pages, m_config.cluster, m_config.clusterThreads,
                       m_protocol, counter);
  summary.clusterMs = elapsedMs(stageStart);
  summary.clusters = detection.clusterCount;
  summary.rejected = detection.rejected;

  if (verbose) {
    std::cerr << "DEBUG: " << detection.clusterCount << " clusters, "
              << detection.candidates.size() << " formula candidates"
              << std::endl;
    for (const auto &candidate : detection.candidates) {
      std::cerr << "DEBUG:   " << candidate.marker << " page "
                << (candidate.pageIndex + 1) << " at (" << candidate.bbox.x0
                << ", " << candidate.bbox.y0 << ") "
                << candidate.bbox.width() << "x" << candidate.bbox.height()
                << ", " << candidate.primitiveCount << " primitives"
                << std::endl;
    }
  }

  // Regions
  stageStart = std::chrono::high_resolution_clock::now();
  std::map<int, FormulaRegionImage> images;
  std::map<int, std::string> imageErrors;
  std::vector<FormulaCandidate> candidates;
  if (!detection.candidates.empty()) {
    RegionRasterizer rasterizer(m_config.raster);
    std::string openError;
    bool opened = rasterizer.open(pdfPath, openError);
    if (!opened) {
      result.warnings.push_back("Region rendering unavailable: " + openError);
    }

    for (const auto &candidate : detection.candidates) {
      if (!opened) {
        imageErrors[candidate.id] = "rasterization failed: " + openError;
        candidates.push_back(candidate);
        continue;
      }

      RasterResult raster =
          rasterizer.rasterize(read.pages[candidate.pageIndex],
                               candidate.bbox, candidate.id,
                               formulasDir.string());
      if (raster.success) {
        images[candidate.id] = raster.image;
      } else if (raster.blank) {
        // Nothing visible to replace; leave the page untouched here
        summary.rejected[RejectionReason::BlankRegion]++;
        for (auto &overlay : detection.pageClusters[candidate.pageIndex]) {
          if (overlay.candidateId == candidate.id) {
            overlay.candidateId = 0;
            overlay.reason = RejectionReason::BlankRegion;
          }
        }
        if (verbose) {
          std::cerr << "DEBUG: " << candidate.marker << " rendered blank"
                    << std::endl;
        }
        continue;
      } else {
        imageErrors[candidate.id] =
            "rasterization failed: " + raster.errorMessage;
      }
      candidates.push_back(candidate);
    }
  }
  summary.rasterMs = elapsedMs(stageStart);
  summary.candidates = static_cast<int>(candidates.size());
  result.candidates = candidates;

  if (m_config.writeDebugOverlays) {
    for (size_t i = 0; i < read.pages.size(); i++) {
      if (detection.pageClusters[i].empty())
        continue;
      fs::path overlayPath = documentDir / "overlays" /
                             ("page_" + std::to_string(i + 1) +
                              "_clusters.png");
      OverlayResult overlay = writeClusterOverlay(
          read.pages[i], detection.pageClusters[i], overlayPath.string());
      if (!overlay.success) {
        result.warnings.push_back(overlay.errorMessage);
        break;
      }
    }
  }

  // Marked working copy
  std::string parseInput = pdfPath;
  if (!candidates.empty() || !m_config.skipWithoutFormulas) {
    stageStart = std::chrono::high_resolution_clock::now();
    fs::path markedPath = documentDir / (result.documentName + "_marked.pdf");
    MarkerInjector injector;
    InjectionResult injection = injector.inject(
        pdfPath, read.pages, candidates, markedPath.string());
    summary.injectMs = elapsedMs(stageStart);
    if (!injection.success) {
      result.errorMessage = injection.errorMessage;
      return;
    }
    result.markedPdfPath = injection.outputPath;
    parseInput = injection.outputPath;
    if (verbose) {
      std::cerr << "DEBUG: Injected " << injection.markersInjected
                << " markers on " << injection.pagesModified << " pages"
                << std::endl;
    }
  } else if (verbose) {
    std::cerr << "DEBUG: No vector formulas, parsing the original document"
              << std::endl;
  }

  // Structural parse
  stageStart = std::chrono::high_resolution_clock::now();
  ParsedDocument parsed =
      m_parser->parse(parseInput, (documentDir / "parsed").string());
  summary.parseMs = elapsedMs(stageStart);
  if (!parsed.success) {
    result.errorMessage =
        "Structural parsing failed (" + m_parser->name() + "): " +
        parsed.errorMessage;
    return;
  }
  if (verbose) {
    std::cerr << "DEBUG: Parsed " << parsed.markdown.size()
              << " bytes of markdown, " << parsed.tables.size()
              << " tables, " << parsed.images.size() << " images"
              << std::endl;
  }

  // Markers to LaTeX
  stageStart = std::chrono::high_resolution_clock::now();
  FormulaResolver resolver(*m_transcriber, m_protocol,
                           m_config.unresolvedPolicy,
                           m_config.vision.maxConcurrency);
  ResolveResult resolved =
      resolver.resolve(parsed.markdown, candidates, images, imageErrors);
  summary.resolveMs = elapsedMs(stageStart);

  result.report = resolved.report;
  summary.resolved = result.report.count(ResolutionStatus::Resolved);
  summary.failed = result.report.count(ResolutionStatus::Failed);
  summary.skipped = result.report.count(ResolutionStatus::Skipped);
  summary.markersRepaired = result.report.markersRepaired;

  if (summary.skipped > 0) {
    result.warnings.push_back(std::to_string(summary.skipped) +
                              " marker(s) lost in structural parsing");
  }
  if (!result.report.unknownMarkerIds.empty()) {
    result.warnings.push_back(
        std::to_string(result.report.unknownMarkerIds.size()) +
        " marker(s) in the parsed markdown match no candidate");
  }

  if (!resolved.success) {
    result.errorMessage = resolved.errorMessage;
    return;
  }

  // Terminal invariant
  result.leakedMarkerIds = FormulaResolver::findLeaks(
      resolved.markdown, result.report, m_protocol,
      m_config.unresolvedPolicy);
  if (!result.leakedMarkerIds.empty()) {
    result.errorMessage = std::to_string(result.leakedMarkerIds.size()) +
                          " marker(s) leaked into the final markdown";
    return;
  }

  result.finalMarkdown = resolved.markdown;
  fs::path outputPath = documentDir / (result.documentName + ".md");
  std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    result.errorMessage = "Failed to write " + outputPath.string();
    return;
  }
  out << result.finalMarkdown;
  out.close();
  if (!out) {
    result.errorMessage = "Failed to write " + outputPath.string();
    return;
  }
  result.outputPath = outputPath.string();

  result.success = true;
  std::cerr << "Resolved " << summary.resolved << "/" << summary.candidates
            << " formulas in " << result.documentName << std::endl;
}

ProcessResult PipelineCoordinator::process(const std::string &pdfPath) {
  ProcessResult result;
  result.success = false;
  result.documentName = documentName(pdfPath);

  auto startTime = std::chrono::high_resolution_clock::now();

  std::unique_lock<std::mutex> documentLock =
      DocumentLockRegistry::global().lock(result.documentName);

  try {
    runStages(pdfPath, result);
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Processing failed: ") + e.what();
  }

  result.processingTimeMs = elapsedMs(startTime);
  return result;
}

} // namespace mathmark
