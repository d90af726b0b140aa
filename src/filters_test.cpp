
#include "filters.h"

#define TOL (1e-12)

#define ASSERT_CLOSE(x,y) \
  ASSERT(fabs((x)-(y)) < TOL, \
      "expected " #x " close to " #y "; actual difference: " << ((x)-(y)))

using namespace Filters;

void test_kernel (size_t width)
{
  LOG("\ntesting derivative kernel of width " << width);

  VectorXd kernel;
  derivative_kernel(width, kernel);
  PRINT(kernel.transpose());

  const int dw = width / 2;
  ASSERT_EQ(kernel.size(), 2 * dw + 1);
  ASSERT_CLOSE(kernel.cwiseAbs().sum(), 1.0);
  ASSERT_CLOSE(kernel(dw), 0.0);
  for (int t = 1; t <= dw; ++t) {
    ASSERT_CLOSE(kernel(dw + t), -kernel(dw - t));
    ASSERT_LT(0, kernel(dw + t));
  }

  LOG("passed");
}

void test_constant_and_ramp (size_t N = 20, size_t width = 5)
{
  LOG("\ntesting time derivative of constant and ramp signals");

  MatrixXd signal(N, 2);
  for (size_t t = 0; t < N; ++t) {
    signal(t, 0) = 3.5;
    signal(t, 1) = 2.0 * t - 7;
  }

  MatrixXd derivative;
  std::vector<size_t> valid;
  time_derivative(signal, width, derivative, valid);

  const size_t dw = width / 2;
  ASSERT_ROWS(derivative, N - 2 * dw);
  ASSERT_COLS(derivative, 2);
  ASSERT_EQ(valid.size(), N - 2 * dw);
  ASSERT_EQ(valid.front(), dw);
  ASSERT_EQ(valid.back(), N - dw - 1);

  for (int r = 0; r < derivative.rows(); ++r) {
    ASSERT_CLOSE(derivative(r, 0), 0.0);
    ASSERT_CLOSE(derivative(r, 1), derivative(0, 1));
  }
  ASSERT_LT(0, derivative(0, 1));

  LOG("passed");
}

void test_removes_drift (size_t N = 120, size_t width = 9)
{
  LOG("\ntesting that the derivative removes linear drift");

  MatrixXd clean(N, 1), drifting(N, 1);
  for (size_t t = 0; t < N; ++t) {
    clean(t, 0) = sin(2 * M_PI * t / 20.0);
    drifting(t, 0) = clean(t, 0) + 0.05 * t;
  }

  MatrixXd d_clean, d_drifting;
  std::vector<size_t> valid;
  time_derivative(clean, width, d_clean, valid);
  time_derivative(drifting, width, d_drifting, valid);

  // drift becomes a constant offset
  VectorXd offset = d_drifting.col(0) - d_clean.col(0);
  for (int r = 0; r < offset.size(); ++r) {
    ASSERT_CLOSE(offset(r), offset(0));
  }

  LOG("passed");
}

void test_too_short (size_t width = 7)
{
  LOG("\ntesting time derivative of a sequence shorter than the kernel");

  MatrixXd signal = MatrixXd::Ones(5, 3);
  MatrixXd derivative;
  std::vector<size_t> valid;
  time_derivative(signal, width, derivative, valid);

  ASSERT_ROWS(derivative, 0);
  ASSERT_COLS(derivative, 3);
  ASSERT(valid.empty(), "expected no valid frames");

  LOG("passed");
}

//----( test harness )--------------------------------------------------------

int main ()
{
  LOG("Testing temporal filters");

  test_kernel(3);
  test_kernel(8);
  test_kernel(15);
  test_constant_and_ramp();
  test_removes_drift();
  test_too_short();

  LOG("\nAll tests passed!");
}
