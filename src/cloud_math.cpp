
#include "cloud_math.h"

namespace Cloud
{

//----( normalization )-------------------------------------------------------

void normalize_rows (
    MatrixXd & cloud,
    std::vector<size_t> & degenerate,
    double tol)
{
  const int I = cloud.rows();
  const int J = cloud.cols();
  ASSERT_LT(0, J);

  degenerate.clear();

  for (int i = 0; i < I; ++i) {

    Eigen::Block<MatrixXd, 1, Eigen::Dynamic> row = cloud.row(i);

    row.array() -= row.mean();

    double norm = row.norm();
    if (norm > tol) {
      row /= norm;
    } else {
      row.setZero();
      degenerate.push_back(i);
    }
  }

  if (not degenerate.empty()) {
    WARN(degenerate.size() << " of " << I << " windows are constant"
        << ", first at row " << degenerate.front());
  }
}

void remove_rows (MatrixXd & cloud, const std::vector<size_t> & rows)
{
  if (rows.empty()) return;

  const size_t I = cloud.rows();

  std::vector<size_t> keep;
  keep.reserve(I);
  for (size_t i = 0, r = 0; i < I; ++i) {
    if ((r < rows.size()) and (rows[r] == i)) {
      ++r;
    } else {
      keep.push_back(i);
    }
  }
  ASSERT_EQ(keep.size() + rows.size(), I);

  MatrixXd kept;
  select_rows(cloud, keep, kept);
  cloud.swap(kept);
}

//----( distances )-----------------------------------------------------------

void pairwise_distances (const MatrixXd & cloud, MatrixXd & distances)
{
  const int I = cloud.rows();

  distances.setZero(I, I);
  for (int i = 0; i < I; ++i) {
    for (int j = 0; j < i; ++j) {
      distances(i,j) = distances(j,i) = sqrt(squared_distance(cloud, i, j));
    }
  }
}

} // namespace Cloud
