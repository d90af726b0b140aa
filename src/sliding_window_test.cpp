
#include "sliding_window.h"

#define TOL (1e-12)

#define ASSERT_CLOSE(x,y) \
  ASSERT(fabs((x)-(y)) < TOL, \
      "expected " #x " close to " #y "; actual difference: " << ((x)-(y)))

using namespace Embedding;

//----( geometry )------------------------------------------------------------

void test_num_windows ()
{
  LOG("\ntesting window counts");

  ASSERT_EQ(num_windows(100, 10, 1, 1), 90);
  ASSERT_EQ(num_windows(100, 10, 1, 2), 45);
  ASSERT_EQ(num_windows(100, 10, 2.5, 1), 75);
  ASSERT_EQ(num_windows(100, 10, 10, 1), 0);
  ASSERT_EQ(num_windows(100, 20, 10, 1), 0);
  ASSERT_EQ(num_windows(1, 1, 1, 1), 0);

  ASSERT_EQ(num_valid_windows(100, 10, 1, 1), 90);

  LOG("passed");
}

void test_truncation_at_boundary ()
{
  LOG("\ntesting truncation of windows that reach past the last frame");

  // window i ends at 0.25 i + 0.5, which rounds up past frame 9 at i = 35
  ASSERT_EQ(num_windows(10, 3, 0.25, 0.25), 37);
  ASSERT_EQ(num_valid_windows(10, 3, 0.25, 0.25), 35);

  MatrixXd frames(10, 2);
  for (int t = 0; t < 10; ++t) {
    frames(t, 0) = t;
    frames(t, 1) = -t;
  }

  MatrixXd cloud;
  size_t M = sliding_window(frames, 3, 0.25, 0.25, cloud);

  ASSERT_EQ(M, 35);
  ASSERT_ROWS(cloud, 35);
  ASSERT_COLS(cloud, 6);

  // the last window ends exactly on the last frame
  ASSERT_CLOSE(cloud(34, 4), 9.0);
  ASSERT_CLOSE(cloud(34, 5), -9.0);

  LOG("passed");
}

//----( embedding )-----------------------------------------------------------

void test_integer_stacking (size_t N = 100, size_t P = 3, size_t dim = 10)
{
  LOG("\ntesting sliding window with integer delays");

  MatrixXd frames(N, P);
  for (size_t t = 0; t < N; ++t) {
    for (size_t p = 0; p < P; ++p) {
      frames(t, p) = random_std();
    }
  }

  MatrixXd cloud;
  size_t M = sliding_window(frames, dim, 1, 1, cloud);

  ASSERT_EQ(M, N - dim);
  ASSERT_ROWS(cloud, M);
  ASSERT_COLS(cloud, dim * P);

  for (size_t i = 0; i < M; ++i) {
    for (size_t j = 0; j < dim; ++j) {
      for (size_t p = 0; p < P; ++p) {
        ASSERT_EQ(cloud(i, P * j + p), frames(i + j, p));
      }
    }
  }

  LOG("passed");
}

void test_strided (size_t N = 50, size_t dim = 4)
{
  LOG("\ntesting sliding window with delay 3 and stride 2");

  MatrixXd frames(N, 1);
  for (size_t t = 0; t < N; ++t) frames(t, 0) = sqr(t);

  MatrixXd cloud;
  size_t M = sliding_window(frames, dim, 3, 2, cloud);

  ASSERT_EQ(M, (N - dim * 3) / 2);
  for (size_t i = 0; i < M; ++i) {
    for (size_t j = 0; j < dim; ++j) {
      ASSERT_EQ(cloud(i, j), sqr(2 * i + 3 * j));
    }
  }

  LOG("passed");
}

void test_fractional_interpolation (size_t N = 40, size_t dim = 5)
{
  LOG("\ntesting sliding window with fractional delays");

  // interpolation is exact on affine trajectories
  MatrixXd frames(N, 2);
  for (size_t t = 0; t < N; ++t) {
    frames(t, 0) = 0.5 * t + 1;
    frames(t, 1) = 3.0 - 2.0 * t;
  }

  const double tau = 1.7;
  const double dt = 0.6;

  MatrixXd cloud;
  size_t M = sliding_window(frames, dim, tau, dt, cloud);

  ASSERT_LT(0, M);
  ASSERT_LE(M, num_windows(N, dim, tau, dt));

  for (size_t i = 0; i < M; ++i) {
    for (size_t j = 0; j < dim; ++j) {
      double time = dt * i + tau * j;
      ASSERT_CLOSE(cloud(i, 2 * j + 0), 0.5 * time + 1);
      ASSERT_CLOSE(cloud(i, 2 * j + 1), 3.0 - 2.0 * time);
    }
  }

  LOG("passed");
}

void test_too_long ()
{
  LOG("\ntesting windows longer than the sequence");

  MatrixXd frames = MatrixXd::Ones(20, 4);

  MatrixXd cloud;
  size_t M = sliding_window(frames, 10, 2, 1, cloud);

  ASSERT_EQ(M, 0);
  ASSERT_ROWS(cloud, 0);
  ASSERT_COLS(cloud, 40);

  LOG("passed");
}

//----( test harness )--------------------------------------------------------

int main ()
{
  LOG("Testing sliding window embedding");

  test_num_windows();
  test_truncation_at_boundary();
  test_integer_stacking();
  test_strided();
  test_fractional_interpolation();
  test_too_long();

  LOG("\nAll tests passed!");
}
