
#include "eigen.h"
#include <fstream>

void select_rows (
    const MatrixXd & A,
    const std::vector<size_t> & rows,
    MatrixXd & result)
{
  result.resize(rows.size(), A.cols());
  for (size_t i = 0; i < rows.size(); ++i) {
    ASSERT_LT(rows[i], static_cast<size_t>(A.rows()));
    result.row(i) = A.row(rows[i]);
  }
}

void save_to_python (const MatrixXd & A, string filename)
{
  LOG("saving " << shape_of(A) << " MatrixXd to " << filename);

  std::ofstream file(filename);
  ASSERT(file, "failed to open " << filename);

  file.precision(17);
  file << "[";
  for (int i = 0; i < A.rows(); ++i) {
    file << "\n  [";
    for (int j = 0; j < A.cols(); ++j) {
      file << A(i,j) << ", ";
    }
    file << "],";
  }
  file << "\n]\n";
}
