#ifndef MATHMARK_TESTS_TEST_PDF_HPP
#define MATHMARK_TESTS_TEST_PDF_HPP

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace mathmark {
namespace testing {

// Content stream drawing a row of filled, curved glyph shapes. x and y are
// PDF user space (origin bottom-left) of the first glyph's lower-left corner.
inline std::string formulaContent(double x, double y, int glyphs) {
  std::ostringstream content;
  content << "0 g\n";
  for (int i = 0; i < glyphs; i++) {
    double left = x + i * 14.0;
    content << left << ' ' << y << " m " << left + 12 << ' ' << y << " l "
            << left + 12 << ' ' << y + 7 << ' ' << left + 12 << ' ' << y + 14
            << ' ' << left << ' ' << y + 14 << " c h f\n";
  }
  return content.str();
}

inline std::string textContent(double x, double y, const std::string &text) {
  std::ostringstream content;
  content << "BT /F1 12 Tf " << x << ' ' << y << " Td (" << text
          << ") Tj ET\n";
  return content.str();
}

// Single-page US Letter PDF with Helvetica available as /F1
inline bool writeSinglePagePdf(const std::string &path,
                               const std::string &content) {
  std::vector<std::string> objects = {
      "<< /Type /Catalog /Pages 2 0 R >>",
      "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
      "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
      "/Resources << /Font << /F1 5 0 R >> >> /Contents 4 0 R >>",
      "<< /Length " + std::to_string(content.size()) + " >>\nstream\n" +
          content + "\nendstream",
      "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica "
      "/Encoding /WinAnsiEncoding >>"};

  std::string pdf = "%PDF-1.4\n";
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); i++) {
    offsets.push_back(pdf.size());
    pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }

  size_t xref = pdf.size();
  pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
  pdf += "0000000000 65535 f \n";
  for (size_t offset : offsets) {
    char entry[32];
    std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
    pdf += entry;
  }
  pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) +
         " /Root 1 0 R >>\nstartxref\n" + std::to_string(xref) + "\n%%EOF\n";

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << pdf;
  return static_cast<bool>(out);
}

} // namespace testing
} // namespace mathmark

#endif // MATHMARK_TESTS_TEST_PDF_HPP
