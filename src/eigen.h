#ifndef HOOP_EIGEN_H
#define HOOP_EIGEN_H

// Frames, compressed coordinates and point clouds are dense double
// matrices with one sample per row.

#include "common.h"
#include <vector>
#include <Eigen/Dense>

//----( utilities )-----------------------------------------------------------

using Eigen::VectorXd;
using Eigen::MatrixXd;

inline string shape_of (const MatrixXd & A)
{
  return std::to_string(A.rows()) + " x " + std::to_string(A.cols());
}

// keeps the listed rows in order
void select_rows (
    const MatrixXd & A,
    const std::vector<size_t> & rows,
    MatrixXd & result);

void save_to_python (const MatrixXd & A, string filename);

#endif // HOOP_EIGEN_H
