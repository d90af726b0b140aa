
#include "filters.h"

namespace Filters
{

//----( temporal derivative )-------------------------------------------------

void derivative_kernel (size_t width, VectorXd & kernel)
{
  ASSERT(width >= 3, "derivative window must span at least 3 frames, got "
      << width);

  const int dw = width / 2;
  const double sigma = 0.4 * dw;

  kernel.resize(2 * dw + 1);
  for (int t = -dw; t <= dw; ++t) {
    kernel(t + dw) = t * exp(-sqr(t) / (2 * sqr(sigma)));
  }
  kernel /= kernel.cwiseAbs().sum();
}

void time_derivative (
    const MatrixXd & signal,
    size_t width,
    MatrixXd & derivative,
    std::vector<size_t> & valid_frames)
{
  VectorXd kernel;
  derivative_kernel(width, kernel);

  const int N = signal.rows();
  const int P = signal.cols();
  const int dw = kernel.size() / 2;
  const int N_out = max(0, N - 2 * dw);

  derivative.setZero(N_out, P);
  valid_frames.resize(N_out);

  for (int r = 0; r < N_out; ++r) {
    for (int t = -dw; t <= dw; ++t) {
      derivative.row(r) += kernel(t + dw) * signal.row(r + dw + t);
    }
    valid_frames[r] = r + dw;
  }

  ASSERTW(N_out > 0, "time derivative of width " << width
      << " leaves no frames of " << N);
  LOG("time derivative: width " << kernel.size() << ", "
      << N << " -> " << N_out << " frames");
}

} // namespace Filters
