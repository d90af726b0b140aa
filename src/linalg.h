#ifndef HOOP_LINALG_H
#define HOOP_LINALG_H

/** Linear algebra structures and algorithms.

  Matrices are Eigen dense matrices with one sample per row.
  Symmetric matrices are stored as full square matrices.
*/

#include "common.h"
#include "eigen.h"

#define PCA_RANK_TOL                    (1e-10)

#define PRINT_MAT(matrix) \
  LOG(#matrix " = " << LinAlg::print_matrix(matrix))

namespace LinAlg
{

string print_matrix (const MatrixXd & A);

//----( gram matrices )-------------------------------------------------------

// G = A A', one inner product per pair of rows
void gram_matrix (const MatrixXd & A, MatrixXd & G);

// subtracts the mean row from every row
void center_columns (MatrixXd & A);

// number of leading eigenvalues above rel_tol times the largest,
// assuming decreasing order; always at least 1 for nonempty input
size_t numerical_rank (
    const VectorXd & eigenvalues,
    double rel_tol = PCA_RANK_TOL);

//----( principal components )------------------------------------------------

/** PCA in frame space via the Gram matrix.

  For N frames of D pixels with N << D, the eigenvectors V of the N x N
  Gram matrix G = I I' scaled by sqrt(lambda) give the coordinates of each
  frame along the principal directions of pixel space:
    coords = V diag(sqrt(lambda)),   coords coords' = G.

  Negative eigenvalues from roundoff are clamped to zero.
  Components are ordered by decreasing eigenvalue.

  rank = 0 keeps the numerical rank; otherwise keeps min(rank, N) columns.
  With center set, the mean frame is removed first.
*/
void gram_pca (
    const MatrixXd & frames,  // rect(N, D)
    MatrixXd & coords,        // rect(N, P)
    VectorXd & eigenvalues,   // vect(P)
    size_t rank = 0,
    bool center = false);

inline void gram_pca (
    const MatrixXd & frames,
    MatrixXd & coords,
    size_t rank = 0,
    bool center = false)
{
  VectorXd eigenvalues;
  gram_pca(frames, coords, eigenvalues, rank, center);
}

// fraction of total variance captured by the leading eigenvalues
double explained_variance (const VectorXd & eigenvalues, size_t count);

} // namespace LinAlg

#endif // HOOP_LINALG_H
