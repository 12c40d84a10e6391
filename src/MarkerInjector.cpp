#include "mathmark/MarkerInjector.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <map>
#include <sstream>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

namespace mathmark {

const char *const MarkerInjector::kFontResource = "MMMarker";

namespace {

// PDF numbers may not use exponent notation
std::string pdfNumber(double value) {
  if (std::abs(value) < 0.0005) {
    value = 0.0; // no "-0.000"
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return out.str();
}

// Escape a string for a PDF literal string
std::string pdfLiteral(const std::string &text) {
  std::string out;
  out.reserve(text.size() + 2);
  out += '(';
  for (char c : text) {
    if (c == '(' || c == ')' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += ')';
  return out;
}

} // anonymous namespace

double MarkerInjector::fitFontSize(const BoundingBox &bbox,
                                   size_t markerLength) {
  const double maxSize = 10.0;
  const double minSize = 4.0;
  double size = std::min(maxSize, bbox.height() * 0.8);
  if (markerLength > 0) {
    size = std::min(size, bbox.width() / (kGlyphAdvance * markerLength));
  }
  return std::max(minSize, size);
}

std::string MarkerInjector::buildOverlayContent(
    const Page &page, const std::vector<const FormulaCandidate *> &candidates,
    const std::string &fontResource) {
  Matrix inverse;
  if (!invertMatrix(page.baseMatrix, inverse)) {
    return std::string();
  }

  std::ostringstream content;
  content << "q\n";
  // Page coordinates from here on (top-left origin, y down)
  for (int i = 0; i < 6; i++) {
    content << pdfNumber(inverse[i]) << ' ';
  }
  content << "cm\n";

  for (const FormulaCandidate *candidate : candidates) {
    const BoundingBox &box = candidate->bbox;
    double fontSize = fitFontSize(box, candidate->marker.size());
    double textWidth = kGlyphAdvance * fontSize * candidate->marker.size();

    // The cover never leaves the box so neighbouring text stays visible.
    // At the minimum font size the marker may overhang both sides evenly.
    double textX = box.x0 + (box.width() - textWidth) / 2.0;
    double baseline = box.y0 + box.height() / 2.0 + fontSize * 0.35;

    content << "1 g\n"
            << pdfNumber(box.x0) << ' ' << pdfNumber(box.y0) << ' '
            << pdfNumber(box.width()) << ' ' << pdfNumber(box.height())
            << " re f\n";
    // The text matrix flips y back so glyphs stand upright
    content << "0 g\nBT\n/" << fontResource << ' ' << pdfNumber(fontSize)
            << " Tf\n1 0 0 -1 " << pdfNumber(textX) << ' '
            << pdfNumber(baseline) << " Tm\n"
            << pdfLiteral(candidate->marker) << " Tj\nET\n";
  }
  content << "Q\n";
  return content.str();
}

void MarkerInjector::writeMarkedCopy(
    const std::string &sourcePath, const std::vector<Page> &pages,
    const std::vector<FormulaCandidate> &candidates,
    const std::string &outputPath, InjectionResult &result) const {
  std::error_code ec;
  if (std::filesystem::exists(outputPath) &&
      std::filesystem::equivalent(sourcePath, outputPath, ec)) {
    result.errorMessage = "Marked copy would overwrite the source: " +
                          outputPath;
    return;
  }

  // Group candidates per page; pages without candidates stay untouched
  std::map<int, std::vector<const FormulaCandidate *>> byPage;
  for (const auto &candidate : candidates) {
    byPage[candidate.pageIndex].push_back(&candidate);
  }

  QPDF pdf;
  pdf.processFile(sourcePath.c_str());

  QPDFPageDocumentHelper pageHelper(pdf);
  std::vector<QPDFPageObjectHelper> pdfPages = pageHelper.getAllPages();

  QPDFObjectHandle font = pdf.makeIndirectObject(QPDFObjectHandle::parse(
      "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica "
      "/Encoding /WinAnsiEncoding >>"));
  const std::string fontKey = std::string("/") + kFontResource;

  for (const auto &entry : byPage) {
    int pageIndex = entry.first;
    if (pageIndex < 0 || pageIndex >= static_cast<int>(pdfPages.size()) ||
        pageIndex >= static_cast<int>(pages.size())) {
      result.errorMessage =
          "Candidate on missing page " + std::to_string(pageIndex + 1);
      return;
    }

    std::string overlay =
        buildOverlayContent(pages[pageIndex], entry.second, kFontResource);
    if (overlay.empty()) {
      result.errorMessage = "Singular page matrix on page " +
                            std::to_string(pageIndex + 1);
      return;
    }

    QPDFPageObjectHelper &pdfPage = pdfPages[pageIndex];

    QPDFObjectHandle resources = pdfPage.getAttribute("/Resources", true);
    if (!resources.isDictionary()) {
      resources = QPDFObjectHandle::newDictionary();
      pdfPage.getObjectHandle().replaceKey("/Resources", resources);
    }
    QPDFObjectHandle fonts = resources.getKey("/Font");
    if (!fonts.isDictionary()) {
      fonts = QPDFObjectHandle::newDictionary();
      resources.replaceKey("/Font", fonts);
    }
    fonts.replaceKey(fontKey, font);

    // Isolate the original graphics state so the overlay starts clean
    pdfPage.addPageContents(QPDFObjectHandle::newStream(&pdf, "q\n"), true);
    pdfPage.addPageContents(
        QPDFObjectHandle::newStream(&pdf, "\nQ\n" + overlay), false);

    result.pagesModified++;
    result.markersInjected += static_cast<int>(entry.second.size());
  }

  std::filesystem::path parent = std::filesystem::path(outputPath).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }

  QPDFWriter writer(pdf, outputPath.c_str());
  writer.setStaticID(true); // same input gives the same bytes
  writer.write();

  result.success = true;
}

InjectionResult
MarkerInjector::inject(const std::string &sourcePath,
                       const std::vector<Page> &pages,
                       const std::vector<FormulaCandidate> &candidates,
                       const std::string &outputPath) const {
  InjectionResult result;
  result.success = false;
  result.outputPath = outputPath;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    writeMarkedCopy(sourcePath, pages, candidates, outputPath, result);
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Marker injection failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace mathmark
