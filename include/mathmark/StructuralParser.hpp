#ifndef MATHMARK_STRUCTURAL_PARSER_HPP
#define MATHMARK_STRUCTURAL_PARSER_HPP

#include "mathmark/PageModel.hpp"
#include "mathmark/PipelineConfig.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mathmark {

/**
 * @brief Markdown produced by a structural parser
 */
struct ParsedDocument {
  bool success = false;            ///< Whether markdown was produced
  std::string errorMessage;        ///< Error message if failed
  std::string markdown;            ///< Full document markdown
  std::vector<std::string> tables; ///< Markdown table blocks, in order
  std::vector<std::string> images; ///< Image references, in order
  double processingTimeMs = 0;     ///< Processing time in milliseconds
};

/**
 * @brief Converts a (marked) PDF to markdown
 *
 * Implementations must pass marker tokens through as text. They may escape
 * them; MarkerProtocol::canonicalize repairs the common variants.
 */
class StructuralParser {
public:
  virtual ~StructuralParser() = default;

  virtual ParsedDocument parse(const std::string &pdfPath,
                               const std::string &outputDir) = 0;

  virtual std::string name() const = 0;
};

/// Fill tables and images of a parsed document from its markdown
void collectTablesAndImages(ParsedDocument &document);

/**
 * @brief One word of the PDF text layer, in page coordinates
 */
struct TextWord {
  std::string text;
  BoundingBox bbox;
  bool spaceAfter = true;
};

/**
 * @brief A line of words after grouping
 */
struct TextLine {
  std::string text;
  BoundingBox bbox;
};

/**
 * @brief Group words into lines
 *
 * Words join a line when their vertical centres lie within half the line
 * height and the horizontal gap stays below three line widths. Lines are
 * returned top to bottom, words within a line left to right.
 */
std::vector<TextLine> groupWordsIntoLines(const std::vector<TextWord> &words);

/**
 * @brief Join lines into markdown paragraphs
 *
 * A vertical gap larger than 0.8 x the average line height starts a new
 * paragraph. Paragraphs are separated by blank lines.
 */
std::string assembleMarkdown(const std::vector<TextLine> &lines);

/**
 * @brief Built-in parser working on the Poppler text layer
 *
 * Produces plain paragraphs only; no tables or images. Pages are separated
 * by blank lines.
 */
class PopplerTextParser : public StructuralParser {
public:
  ParsedDocument parse(const std::string &pdfPath,
                       const std::string &outputDir) override;
  std::string name() const override { return "poppler-text"; }

private:
  void extractText(const std::string &pdfPath, ParsedDocument &result) const;
};

/**
 * @brief Runs an external converter through the shell
 *
 * The command template may use {input} and {output_dir}, which are replaced
 * by single-quoted shell words. The markdown is
 * read from <output_dir>/<input stem>.md when the converter writes one,
 * otherwise from the command's standard output.
 */
class CommandStructuralParser : public StructuralParser {
public:
  explicit CommandStructuralParser(std::string commandTemplate);

  ParsedDocument parse(const std::string &pdfPath,
                       const std::string &outputDir) override;
  std::string name() const override { return "command"; }

  /// Command line after placeholder substitution and quoting
  std::string buildCommand(const std::string &pdfPath,
                           const std::string &outputDir) const;

private:
  void runCommand(const std::string &pdfPath, const std::string &outputDir,
                  ParsedDocument &result) const;

  std::string m_commandTemplate;
};

/// Parser selected by the configuration
std::unique_ptr<StructuralParser>
createStructuralParser(const ParserConfig &config);

} // namespace mathmark

#endif // MATHMARK_STRUCTURAL_PARSER_HPP
