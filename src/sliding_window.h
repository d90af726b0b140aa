#ifndef HOOP_SLIDING_WINDOW_H
#define HOOP_SLIDING_WINDOW_H

#include "common.h"
#include "eigen.h"

namespace Embedding
{

// a row of a column-major cloud, or a slice of one
typedef Eigen::Ref<Eigen::RowVectorXd, 0, Eigen::InnerStride<> > RowRef;

//----( window geometry )-----------------------------------------------------

// M = floor((N - dim tau) / dt), or 0 when the windows do not fit
size_t num_windows (size_t num_frames, size_t dim, double tau, double dt);

/** Number of windows that can actually be interpolated.

  Window i reads frames up to ceil(dt i + tau (dim - 1)), which may reach
  past the last frame due to rounding near the boundary. Such windows and
  all later ones are dropped rather than treated as an error.
*/
size_t num_valid_windows (
    size_t num_frames,
    size_t dim,
    double tau,
    double dt);

//----( delay embedding )-----------------------------------------------------

/** Sliding-window embedding of a frame trajectory.

  Row i of the cloud stacks the dim frames sampled at times
    dt i + tau j,   j = 0, ..., dim-1,
  each linearly interpolated in time between the bracketing frames.
  tau and dt may be fractional. Windows are filled in parallel.

  Returns the number of windows; an empty cloud (0 x dim P) signals that
  the geometry does not fit in the sequence.
*/
size_t sliding_window (
    const MatrixXd & frames,  // rect(N, P)
    size_t dim,
    double tau,
    double dt,
    MatrixXd & cloud);        // rect(M, dim P)

// linear interpolation of the trajectory at fractional frame time
void interpolate_frame (
    const MatrixXd & frames,
    double time,
    RowRef result);

} // namespace Embedding

#endif // HOOP_SLIDING_WINDOW_H
