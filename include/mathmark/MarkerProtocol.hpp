#ifndef MATHMARK_MARKER_PROTOCOL_HPP
#define MATHMARK_MARKER_PROTOCOL_HPP

#include <string>
#include <vector>

namespace mathmark {

/**
 * @brief Marker token format shared by the injector and the resolver
 *
 * Markers are the side channel through the structural parser: a token such
 * as "##FORMULA_001##" is drawn in place of each formula and must come back
 * unchanged in the parsed markdown. The protocol owns the token format, the
 * allowed alphabet, recognition in text, and repair of the escaping that
 * markdown exporters commonly apply ("\#\#FORMULA\_001\#\#").
 */
class MarkerProtocol {
public:
  /**
   * @brief A marker occurrence found in text
   */
  struct Occurrence {
    size_t position = 0; ///< Byte offset of the first character
    size_t length = 0;   ///< Length of the matched text
    int id = 0;          ///< Candidate id encoded in the marker
  };

  MarkerProtocol();
  MarkerProtocol(const std::string &prefix, const std::string &suffix,
                 int digits);

  /// Canonical marker for an id, e.g. format(1) == "##FORMULA_001##"
  std::string format(int id) const;

  /// Parse a canonical marker; returns -1 if text is not one
  int parse(const std::string &text) const;

  /// Every canonical marker in text, in order of position
  std::vector<Occurrence> findAll(const std::string &text) const;

  /// True if text contains any canonical marker
  bool containsMarker(const std::string &text) const;

  /**
   * @brief Rewrite escaped or spaced marker variants into canonical form
   *
   * Accepts backslash escapes before '#' and '_' and whitespace between the
   * prefix, the digits and the suffix.
   *
   * @param text Markdown returned by the structural parser
   * @param repaired Incremented once per rewritten occurrence
   * @return Text with every recognizable variant made canonical
   */
  std::string canonicalize(const std::string &text, int *repaired = nullptr) const;

  /**
   * @brief Check that a string uses only the marker alphabet
   *
   * Allowed: '#', '_', 'A'-'Z', '0'-'9'. Rejects whitespace, markdown
   * emphasis and code characters, and PDF string delimiters.
   */
  static bool isValidAlphabet(const std::string &text);

  /// Validate the configured prefix/suffix and a sample of generated ids
  bool verify(std::string *errorMessage = nullptr) const;

  const std::string &prefix() const { return m_prefix; }
  const std::string &suffix() const { return m_suffix; }

private:
  std::string m_prefix;
  std::string m_suffix;
  int m_digits;
};

/**
 * @brief Monotonic candidate id source for one document
 *
 * Passed explicitly through the pipeline so ids are unique across all pages
 * of a document without any process-wide state.
 */
class CandidateIdCounter {
public:
  explicit CandidateIdCounter(int first = 1) : m_next(first) {}

  int next() { return m_next++; }
  int peek() const { return m_next; }

private:
  int m_next;
};

} // namespace mathmark

#endif // MATHMARK_MARKER_PROTOCOL_HPP
