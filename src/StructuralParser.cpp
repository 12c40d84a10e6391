#include "mathmark/StructuralParser.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

#include <sys/wait.h>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page.h>

namespace mathmark {

namespace {

std::string trimLeft(const std::string &text) {
  size_t start = text.find_first_not_of(" \t");
  return start == std::string::npos ? std::string() : text.substr(start);
}

void replaceAll(std::string &text, const std::string &from,
                const std::string &to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Single-quoted shell word; embedded quotes become '\''
std::string shellQuote(const std::string &value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

std::string readFile(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

} // anonymous namespace

void collectTablesAndImages(ParsedDocument &document) {
  document.tables.clear();
  document.images.clear();

  std::istringstream in(document.markdown);
  std::string line;
  std::string table;
  while (std::getline(in, line)) {
    if (trimLeft(line).rfind("|", 0) == 0) {
      table += line + "\n";
      continue;
    }
    if (!table.empty()) {
      document.tables.push_back(table);
      table.clear();
    }
  }
  if (!table.empty()) {
    document.tables.push_back(table);
  }

  static const std::regex imagePattern(R"(!\[[^\]]*\]\(([^)\s]+)[^)]*\))");
  for (std::sregex_iterator it(document.markdown.begin(),
                               document.markdown.end(), imagePattern),
       end;
       it != end; ++it) {
    document.images.push_back((*it)[1].str());
  }
}

std::vector<TextLine> groupWordsIntoLines(const std::vector<TextWord> &words) {
  std::vector<size_t> order(words.size());
  for (size_t i = 0; i < order.size(); i++) {
    order[i] = i;
  }
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    if (words[a].bbox.y0 != words[b].bbox.y0)
      return words[a].bbox.y0 < words[b].bbox.y0;
    return words[a].bbox.x0 < words[b].bbox.x0;
  });

  std::vector<TextLine> lines;
  std::vector<bool> used(words.size(), false);

  for (size_t oi = 0; oi < order.size(); oi++) {
    size_t i = order[oi];
    if (used[i] || words[i].text.empty())
      continue;
    used[i] = true;

    BoundingBox lineBox = words[i].bbox;
    std::vector<size_t> members{i};

    // Tolerance for considering words on the same line
    double tolerance = std::max(2.0, lineBox.height() / 2.0);

    for (size_t oj = oi + 1; oj < order.size(); oj++) {
      size_t j = order[oj];
      if (used[j] || words[j].text.empty())
        continue;

      const BoundingBox &candidate = words[j].bbox;
      double yCenter1 = (lineBox.y0 + lineBox.y1) / 2.0;
      double yCenter2 = (candidate.y0 + candidate.y1) / 2.0;
      double yDiff = std::abs(yCenter1 - yCenter2);
      double horizontalGap = std::min(std::abs(candidate.x0 - lineBox.x1),
                                      std::abs(lineBox.x0 - candidate.x1));

      if (yDiff <= tolerance && horizontalGap < lineBox.width() * 3) {
        used[j] = true;
        members.push_back(j);
        lineBox = lineBox.unite(candidate);
      }
    }

    std::sort(members.begin(), members.end(), [&](size_t a, size_t b) {
      return words[a].bbox.x0 < words[b].bbox.x0;
    });

    TextLine line;
    line.bbox = lineBox;
    for (size_t k = 0; k < members.size(); k++) {
      line.text += words[members[k]].text;
      if (k + 1 < members.size() && words[members[k]].spaceAfter) {
        line.text += " ";
      }
    }
    lines.push_back(line);
  }

  std::stable_sort(lines.begin(), lines.end(),
                   [](const TextLine &a, const TextLine &b) {
                     if (a.bbox.y0 != b.bbox.y0)
                       return a.bbox.y0 < b.bbox.y0;
                     return a.bbox.x0 < b.bbox.x0;
                   });
  return lines;
}

std::string assembleMarkdown(const std::vector<TextLine> &lines) {
  if (lines.empty()) {
    return std::string();
  }

  double totalHeight = 0;
  for (const auto &line : lines) {
    totalHeight += line.bbox.height();
  }
  double paragraphGap = 0.8 * totalHeight / lines.size();

  std::string markdown = lines.front().text;
  for (size_t i = 1; i < lines.size(); i++) {
    double gap = lines[i].bbox.y0 - lines[i - 1].bbox.y1;
    markdown += gap > paragraphGap ? "\n\n" : " ";
    markdown += lines[i].text;
  }
  markdown += "\n";
  return markdown;
}

void PopplerTextParser::extractText(const std::string &pdfPath,
                                    ParsedDocument &result) const {
  std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_file(pdfPath));

  if (!doc) {
    result.errorMessage = "Failed to load PDF file: " + pdfPath;
    return;
  }
  if (doc->is_locked()) {
    result.errorMessage = "PDF file is password protected: " + pdfPath;
    return;
  }

  std::vector<std::string> pageTexts;
  for (int pageIndex = 0; pageIndex < doc->pages(); pageIndex++) {
    std::unique_ptr<poppler::page> page(doc->create_page(pageIndex));
    if (!page) {
      std::cerr << "Warning: failed to create page " << (pageIndex + 1)
                << ", skipping" << std::endl;
      continue;
    }

    std::vector<TextWord> words;
    for (const auto &textBox : page->text_list()) {
      poppler::byte_array textBytes = textBox.text().to_utf8();
      std::string text(textBytes.begin(), textBytes.end());
      if (text.empty()) {
        continue;
      }
      // Text boxes already use a top-left origin
      poppler::rectf box = textBox.bbox();
      TextWord word;
      word.text = text;
      word.bbox = BoundingBox(box.x(), box.y(), box.x() + box.width(),
                              box.y() + box.height());
      word.spaceAfter = textBox.has_space_after();
      words.push_back(word);
    }

    std::string pageText = assembleMarkdown(groupWordsIntoLines(words));
    if (!pageText.empty()) {
      pageTexts.push_back(pageText);
    }
  }

  for (size_t i = 0; i < pageTexts.size(); i++) {
    if (i > 0) {
      result.markdown += "\n";
    }
    result.markdown += pageTexts[i];
  }

  collectTablesAndImages(result);
  result.success = true;
}

ParsedDocument PopplerTextParser::parse(const std::string &pdfPath,
                                        const std::string & /*outputDir*/) {
  ParsedDocument result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    extractText(pdfPath, result);
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Text layer parsing failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

CommandStructuralParser::CommandStructuralParser(std::string commandTemplate)
    : m_commandTemplate(std::move(commandTemplate)) {}

std::string
CommandStructuralParser::buildCommand(const std::string &pdfPath,
                                      const std::string &outputDir) const {
  std::string command = m_commandTemplate;
  replaceAll(command, "{input}", shellQuote(pdfPath));
  replaceAll(command, "{output_dir}", shellQuote(outputDir));
  return command;
}

void CommandStructuralParser::runCommand(const std::string &pdfPath,
                                         const std::string &outputDir,
                                         ParsedDocument &result) const {
  std::filesystem::create_directories(outputDir);
  std::filesystem::path expected =
      std::filesystem::path(outputDir) /
      (std::filesystem::path(pdfPath).stem().string() + ".md");
  // A stale file from an earlier run must not be mistaken for output
  std::filesystem::remove(expected);

  std::string command = buildCommand(pdfPath, outputDir);
  FILE *pipe = popen(command.c_str(), "r");
  if (!pipe) {
    result.errorMessage = "Failed to run parser command: " + command;
    return;
  }

  std::string output;
  char buffer[4096];
  size_t bytesRead;
  while ((bytesRead = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    output.append(buffer, bytesRead);
  }

  int status = pclose(pipe);
  if (status == -1) {
    result.errorMessage = "Failed to wait for parser command: " + command;
    return;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    result.errorMessage =
        "Parser command failed with status " +
        std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : status) +
        ": " + command;
    return;
  }

  if (std::filesystem::exists(expected)) {
    result.markdown = readFile(expected);
  } else {
    result.markdown = output;
  }

  if (result.markdown.find_first_not_of(" \t\r\n") == std::string::npos) {
    result.errorMessage = "Parser command produced no markdown";
    return;
  }

  collectTablesAndImages(result);
  result.success = true;
}

ParsedDocument CommandStructuralParser::parse(const std::string &pdfPath,
                                              const std::string &outputDir) {
  ParsedDocument result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    runCommand(pdfPath, outputDir, result);
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Parser command failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

std::unique_ptr<StructuralParser>
createStructuralParser(const ParserConfig &config) {
  if (config.kind == ParserConfig::Kind::Command) {
    return std::make_unique<CommandStructuralParser>(config.command);
  }
  return std::make_unique<PopplerTextParser>();
}

} // namespace mathmark
