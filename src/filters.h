#ifndef HOOP_FILTERS_H
#define HOOP_FILTERS_H

#include "common.h"
#include "eigen.h"
#include <vector>

namespace Filters
{

//----( temporal derivative )-------------------------------------------------

/** Gaussian derivative kernel over t in [-dw, dw], dw = floor(width / 2),

    h(t) = t exp(-t^2 / 2 sigma^2),   sigma = 0.4 dw,

  normalized to unit L1 norm, so that the response to a unit-slope ramp is
  independent of the window width up to the Gaussian weighting.
*/
void derivative_kernel (size_t width, VectorXd & kernel);

/** Time derivative of every column, suppressing drift before embedding.

  Row r of the result estimates the slope at input frame r + dw.
  valid_frames lists those input frame indices, dw .. N-dw-1.
  Sequences shorter than the kernel yield an empty result.
*/
void time_derivative (
    const MatrixXd & signal,             // rect(N, P)
    size_t width,
    MatrixXd & derivative,               // rect(N - 2 dw, P)
    std::vector<size_t> & valid_frames); // vect(N - 2 dw)

} // namespace Filters

#endif // HOOP_FILTERS_H
