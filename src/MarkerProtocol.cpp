#include "mathmark/MarkerProtocol.hpp"

#include <iomanip>
#include <regex>
#include <sstream>

namespace mathmark {

namespace {

const char *const kDefaultPrefix = "##FORMULA_";
const char *const kDefaultSuffix = "##";
const int kDefaultDigits = 3;

std::string escapeRegex(const std::string &text) {
  static const std::string special = R"(\^$.|?*+()[]{}/)";
  std::string escaped;
  for (char c : text) {
    if (special.find(c) != std::string::npos)
      escaped += '\\';
    escaped += c;
  }
  return escaped;
}

// Pattern for the tolerant form of a literal: optional backslash before
// '#' and '_', optional whitespace between the parts
std::string tolerantPattern(const std::string &literal) {
  std::string pattern;
  for (char c : literal) {
    if (c == '#' || c == '_') {
      pattern += R"(\\?)";
    }
    pattern += escapeRegex(std::string(1, c));
  }
  return pattern;
}

} // anonymous namespace

MarkerProtocol::MarkerProtocol()
    : m_prefix(kDefaultPrefix), m_suffix(kDefaultSuffix),
      m_digits(kDefaultDigits) {}

MarkerProtocol::MarkerProtocol(const std::string &prefix,
                               const std::string &suffix, int digits)
    : m_prefix(prefix), m_suffix(suffix), m_digits(digits) {}

std::string MarkerProtocol::format(int id) const {
  std::ostringstream marker;
  marker << m_prefix << std::setw(m_digits) << std::setfill('0') << id
         << m_suffix;
  return marker.str();
}

int MarkerProtocol::parse(const std::string &text) const {
  if (text.size() <= m_prefix.size() + m_suffix.size())
    return -1;
  if (text.compare(0, m_prefix.size(), m_prefix) != 0)
    return -1;
  if (text.compare(text.size() - m_suffix.size(), m_suffix.size(), m_suffix) !=
      0)
    return -1;

  std::string digits = text.substr(
      m_prefix.size(), text.size() - m_prefix.size() - m_suffix.size());
  if (digits.size() < static_cast<size_t>(m_digits))
    return -1;
  for (char c : digits) {
    if (c < '0' || c > '9')
      return -1;
  }
  try {
    return std::stoi(digits);
  } catch (const std::exception &) {
    return -1;
  }
}

std::vector<MarkerProtocol::Occurrence>
MarkerProtocol::findAll(const std::string &text) const {
  std::vector<Occurrence> occurrences;
  const std::regex pattern(escapeRegex(m_prefix) + "([0-9]{" +
                           std::to_string(m_digits) + ",})" +
                           escapeRegex(m_suffix));

  for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
       it != std::sregex_iterator(); ++it) {
    Occurrence occurrence;
    occurrence.position = static_cast<size_t>(it->position(0));
    occurrence.length = static_cast<size_t>(it->length(0));
    try {
      occurrence.id = std::stoi((*it)[1].str());
    } catch (const std::exception &) {
      continue; // digits overflow int; not one of ours
    }
    occurrences.push_back(occurrence);
  }
  return occurrences;
}

bool MarkerProtocol::containsMarker(const std::string &text) const {
  return !findAll(text).empty();
}

std::string MarkerProtocol::canonicalize(const std::string &text,
                                         int *repaired) const {
  const std::regex pattern(tolerantPattern(m_prefix) + R"(\s*([0-9]{)" +
                           std::to_string(m_digits) + R"(,})\s*)" +
                           tolerantPattern(m_suffix));

  std::string output;
  output.reserve(text.size());
  size_t last = 0;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
       it != std::sregex_iterator(); ++it) {
    size_t position = static_cast<size_t>(it->position(0));
    std::string matched = it->str(0);
    std::string canonical = m_prefix + (*it)[1].str() + m_suffix;

    output.append(text, last, position - last);
    output += canonical;
    last = position + matched.size();

    if (matched != canonical && repaired != nullptr)
      (*repaired)++;
  }
  output.append(text, last, std::string::npos);
  return output;
}

bool MarkerProtocol::isValidAlphabet(const std::string &text) {
  for (char c : text) {
    bool allowed = c == '#' || c == '_' || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9');
    if (!allowed)
      return false;
  }
  return !text.empty();
}

bool MarkerProtocol::verify(std::string *errorMessage) const {
  auto fail = [errorMessage](const std::string &message) {
    if (errorMessage != nullptr)
      *errorMessage = message;
    return false;
  };

  if (m_digits < 1)
    return fail("marker needs at least one digit");
  if (!isValidAlphabet(m_prefix) || !isValidAlphabet(m_suffix))
    return fail("marker prefix/suffix outside the allowed alphabet");

  // A prefix ending in a digit would make "...1" + "23" ambiguous
  char lastPrefix = m_prefix.back();
  char firstSuffix = m_suffix.front();
  if ((lastPrefix >= '0' && lastPrefix <= '9') ||
      (firstSuffix >= '0' && firstSuffix <= '9'))
    return fail("marker prefix/suffix must not touch the digits with a digit");

  // Round trip a sample of ids, including ones wider than the padding
  for (int id : {0, 1, 9, 42, 999, 1000, 123456}) {
    std::string marker = format(id);
    if (parse(marker) != id)
      return fail("marker round trip failed for " + marker);
    auto found = findAll("text " + marker + " text");
    if (found.size() != 1 || found[0].id != id)
      return fail("marker not recognized in text: " + marker);
  }
  return true;
}

} // namespace mathmark
