
#include "linalg.h"
#include <sstream>
#include <Eigen/Eigenvalues>

namespace LinAlg
{

string print_matrix (const MatrixXd & A)
{
  std::ostringstream o;
  o << "\n" << A;
  return o.str();
}

//----( gram matrices )-------------------------------------------------------

void gram_matrix (const MatrixXd & A, MatrixXd & G)
{
  const int N = A.rows();

  G.resize(N, N);
  G.noalias() = A * A.transpose();
}

void center_columns (MatrixXd & A)
{
  if (A.rows() == 0) return;

  Eigen::RowVectorXd mean = A.colwise().mean();
  A.rowwise() -= mean;
}

size_t numerical_rank (const VectorXd & eigenvalues, double rel_tol)
{
  const size_t N = eigenvalues.size();
  if (N == 0) return 0;

  const double thresh = rel_tol * max(0.0, eigenvalues(0));

  size_t rank = 1;
  while ((rank < N) and (eigenvalues(rank) > thresh)) ++rank;
  return rank;
}

//----( principal components )------------------------------------------------

void gram_pca (
    const MatrixXd & frames,
    MatrixXd & coords,
    VectorXd & eigenvalues,
    size_t rank,
    bool center)
{
  const size_t N = frames.rows();
  ASSERT_LT(0, N);
  ASSERT_LT(0, frames.cols());

  MatrixXd G;
  if (center) {
    MatrixXd centered = frames;
    center_columns(centered);
    gram_matrix(centered, G);
  } else {
    gram_matrix(frames, G);
  }

  Eigen::SelfAdjointEigenSolver<MatrixXd> solver(G);
  ASSERT(solver.info() == Eigen::Success,
      "eigendecomposition of " << shape_of(G) << " gram matrix failed");

  // eigen returns increasing order; reverse to decreasing
  VectorXd lambda = solver.eigenvalues().reverse();
  MatrixXd V = solver.eigenvectors().rowwise().reverse();

  size_t num_clamped = 0;
  for (size_t i = 0; i < N; ++i) {
    if (lambda(i) < 0) {
      lambda(i) = 0;
      ++num_clamped;
    }
  }

  const size_t P = rank ? min(rank, N) : numerical_rank(lambda);

  eigenvalues = lambda.head(P);
  coords = V.leftCols(P) * eigenvalues.cwiseSqrt().asDiagonal();

  if (num_clamped) {
    LOG(" clamped " << num_clamped << " negative eigenvalues to zero");
  }
  LOG("gram pca: " << shape_of(frames) << " frames -> " << shape_of(coords)
      << " coords, explained variance " << explained_variance(lambda, P));
}

double explained_variance (const VectorXd & eigenvalues, size_t count)
{
  ASSERT_LE(count, static_cast<size_t>(eigenvalues.size()));

  double total = eigenvalues.sum();
  return total > 0 ? eigenvalues.head(count).sum() / total : 1.0;
}

} // namespace LinAlg
