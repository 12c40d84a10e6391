#include "mathmark/PageModel.hpp"

#include <cmath>

namespace mathmark {

bool invertMatrix(const Matrix &m, Matrix &inverse) {
  double det = m[0] * m[3] - m[1] * m[2];
  if (std::abs(det) < 1e-12) {
    return false;
  }
  inverse[0] = m[3] / det;
  inverse[1] = -m[1] / det;
  inverse[2] = -m[2] / det;
  inverse[3] = m[0] / det;
  inverse[4] = (m[2] * m[5] - m[3] * m[4]) / det;
  inverse[5] = (m[1] * m[4] - m[0] * m[5]) / det;
  return true;
}

} // namespace mathmark
