#ifndef HOOP_CLOUD_MATH_H
#define HOOP_CLOUD_MATH_H

#include "common.h"
#include "eigen.h"
#include <vector>

#define CLOUD_DEGENERATE_TOL            (1e-12)

namespace Cloud
{

//----( normalization )-------------------------------------------------------

/** Centers each row on its own mean, then scales it to unit L2 norm.

  Rows with (nearly) constant entries have no direction; they are left at
  zero and their indices are returned in degenerate, in increasing order.
*/
void normalize_rows (
    MatrixXd & cloud,
    std::vector<size_t> & degenerate,
    double tol = CLOUD_DEGENERATE_TOL);

// drops the given increasing row indices
void remove_rows (MatrixXd & cloud, const std::vector<size_t> & rows);

//----( distances )-----------------------------------------------------------

// D(i,j) = |x_i - x_j|, symmetric with zero diagonal
void pairwise_distances (const MatrixXd & cloud, MatrixXd & distances);

inline double squared_distance (const MatrixXd & cloud, int i, int j)
{
  return (cloud.row(i) - cloud.row(j)).squaredNorm();
}

} // namespace Cloud

#endif // HOOP_CLOUD_MATH_H
