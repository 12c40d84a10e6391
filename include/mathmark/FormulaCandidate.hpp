#ifndef MATHMARK_FORMULA_CANDIDATE_HPP
#define MATHMARK_FORMULA_CANDIDATE_HPP

#include "mathmark/PageModel.hpp"

#include <string>

namespace mathmark {

/**
 * @brief A cluster accepted as a formula, with its marker
 *
 * Created once during page classification and read-only afterwards.
 */
struct FormulaCandidate {
  int id = 0;               ///< Unique within the document, 1-based
  int pageIndex = 0;        ///< 0-indexed page number
  BoundingBox bbox;         ///< Region in page coordinates
  int primitiveCount = 0;   ///< Primitives in the source cluster
  std::string marker;       ///< Token injected in place of the formula
};

} // namespace mathmark

#endif // MATHMARK_FORMULA_CANDIDATE_HPP
