
#include "sliding_window.h"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace Embedding
{

//----( window geometry )-----------------------------------------------------

size_t num_windows (size_t num_frames, size_t dim, double tau, double dt)
{
  ASSERT_LT(0, dim);
  ASSERT_LT(0, tau);
  ASSERT_LT(0, dt);

  double span = num_frames - dim * tau;
  if (not (span > 0)) return 0;

  return static_cast<size_t>(floor(span / dt));
}

inline double window_start (size_t i, double dt) { return dt * i; }
inline double window_end (size_t i, size_t dim, double tau, double dt)
{
  return dt * i + tau * (dim - 1);
}

size_t num_valid_windows (
    size_t num_frames,
    size_t dim,
    double tau,
    double dt)
{
  const size_t M = num_windows(num_frames, dim, tau, dt);

  for (size_t i = 0; i < M; ++i) {
    if (ceil(window_end(i, dim, tau, dt)) >= num_frames) return i;
  }
  return M;
}

//----( delay embedding )-----------------------------------------------------

void interpolate_frame (
    const MatrixXd & frames,
    double time,
    RowRef result)
{
  const int N = frames.rows();

  int i0 = static_cast<int>(floor(time));
  double w1 = time - i0;

  ASSERT1((0 <= i0) and (i0 < N),
      "interpolation time " << time << " out of range [0," << N << ")");

  if (w1 > 0) {
    ASSERT1_LT(i0 + 1, N);
    result = (1 - w1) * frames.row(i0) + w1 * frames.row(i0 + 1);
  } else {
    result = frames.row(i0);
  }
}

namespace
{
struct FillWindows
{
  const MatrixXd * frames;
  const size_t dim;
  const double tau;
  const double dt;
  MatrixXd * cloud;

  void operator() (const tbb::blocked_range<size_t> & range) const
  {
    const size_t P = frames->cols();

    for (size_t i = range.begin(); i != range.end(); ++i) {
      for (size_t j = 0; j < dim; ++j) {

        double time = window_start(i, dt) + tau * j;
        RowRef sample = cloud->row(i).segment(P * j, P);

        interpolate_frame(* frames, time, sample);
      }
    }
  }
};
} // anonymous namespace

size_t sliding_window (
    const MatrixXd & frames,
    size_t dim,
    double tau,
    double dt,
    MatrixXd & cloud)
{
  const size_t N = frames.rows();
  const size_t P = frames.cols();

  const size_t M_nominal = num_windows(N, dim, tau, dt);
  const size_t M = num_valid_windows(N, dim, tau, dt);

  cloud.resize(M, dim * P);

  if (M == 0) {
    LOG("sliding window: dim " << dim << " x tau " << tau
        << " does not fit in " << N << " frames; cloud is empty");
    return 0;
  }

  FillWindows tasks = { & frames, dim, tau, dt, & cloud };

  tbb::blocked_range<size_t> range(0, M);
  tbb::parallel_for(range, tasks);

  if (M < M_nominal) {
    LOG(" truncated cloud from " << M_nominal << " to " << M
        << " windows at sequence boundary");
  }
  LOG("sliding window: " << shape_of(frames) << " frames, dim = " << dim
      << ", tau = " << tau << ", dt = " << dt << " -> "
      << shape_of(cloud) << " cloud");

  return M;
}

} // namespace Embedding
