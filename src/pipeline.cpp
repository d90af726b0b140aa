
#include "pipeline.h"
#include "linalg.h"
#include "filters.h"
#include "sliding_window.h"
#include "cloud_math.h"

namespace Pipeline
{

//----( configuration )-------------------------------------------------------

void Config::load (const ConfigParser & config)
{
  dim = config("dim", dim);
  tau = config("tau", tau);
  dt = config("dt", dt);
  deriv_win = config("deriv_win", deriv_win);
  use_pca = config("use_pca", use_pca);
  pca_rank = config("pca_rank", pca_rank);
  pca_center = config("pca_center", pca_center);
  max_dim = config("max_dim", max_dim);
  coeff = config("coeff", coeff);
  threshold = config("threshold", threshold);
}

void Config::validate () const
{
  ASSERT(dim >= 1, "window dimension must be positive, got " << dim);
  ASSERT(tau > 0, "tau must be positive, got " << tau);
  ASSERT(dt > 0, "dt must be positive, got " << dt);
  ASSERT_FINITE(tau);
  ASSERT_FINITE(dt);
  ASSERT((deriv_win == 0) or (deriv_win >= 3),
      "deriv_win must be 0 (off) or at least 3, got " << deriv_win);
  ASSERT_LE(max_dim, PERSISTENCE_MAX_DIM);
  ASSERT(is_prime(coeff) and (coeff <= PERSISTENCE_MAX_COEFF),
      "coeff must be a prime <= " << PERSISTENCE_MAX_COEFF
      << ", got " << coeff);
  ASSERT(threshold > 0, "threshold must be positive, got " << threshold);
}

ostream & operator<< (ostream & o, const Config & c)
{
  o << "dim = " << c.dim
    << ", tau = " << c.tau
    << ", dt = " << c.dt
    << ", deriv_win = " << c.deriv_win;
  if (c.use_pca) {
    o << ", pca_rank = " << c.pca_rank << (c.pca_center ? " centered" : "");
  } else {
    o << ", no pca";
  }
  return o
    << ", max_dim = " << c.max_dim
    << ", coeff = " << c.coeff
    << ", threshold = " << c.threshold;
}

//----( analysis )------------------------------------------------------------

void embed (
    const Frames::FrameSequence & seq,
    const Config & config,
    Result & result)
{
  config.validate();
  seq.validate();
  ASSERT_LT(0, seq.size());

  const size_t N = seq.size();

  if (config.use_pca) {
    LinAlg::gram_pca(
        seq.frames,
        result.coords,
        config.pca_rank,
        config.pca_center);
  } else {
    result.coords = seq.frames;
  }
  ASSERT_ROWS(result.coords, N);

  result.valid_frames.resize(N);
  for (size_t t = 0; t < N; ++t) result.valid_frames[t] = t;

  if (config.deriv_win) {
    MatrixXd derivative;
    std::vector<size_t> valid;
    Filters::time_derivative(
        result.coords,
        config.deriv_win,
        derivative,
        valid);

    result.coords.swap(derivative);
    result.valid_frames.swap(valid);
  }

  Embedding::sliding_window(
      result.coords,
      config.dim,
      config.tau,
      config.dt,
      result.cloud);
  ASSERT_COLS(result.cloud, config.dim * result.coords.cols());

  result.degenerate.clear();
  if (result.cloud.rows()) {
    Cloud::normalize_rows(result.cloud, result.degenerate);
    Cloud::remove_rows(result.cloud, result.degenerate);
  }
}

void run (
    const Frames::FrameSequence & seq,
    const Config & config,
    Topology::PersistenceEngine & engine,
    Result & result)
{
  embed(seq, config, result);

  result.diagrams.clear(config.max_dim, config.coeff);
  result.scores = Periodicity::Scores();

  if (result.empty()) {
    LOG("no windows to analyze for " << config);
    return;
  }

  engine.compute(result.cloud, config.max_dim, config.coeff, config.threshold,
      result.diagrams);
  result.diagrams.print_summary();

  Periodicity::score(result.diagrams, result.scores);
  LOG(result.scores);
}

//----( parameter sweeps )----------------------------------------------------

void sweep (
    const Frames::FrameSequence & seq,
    const Config & base,
    const std::vector<size_t> & dims,
    bool fix_window_length,
    Topology::PersistenceEngine & engine,
    std::vector<SweepPoint> & points)
{
  ASSERT(not dims.empty(), "sweep needs at least one window dimension");

  points.clear();

  for (size_t i = 0; i < dims.size(); ++i) {

    Config config = base;
    config.dim = dims[i];
    if (fix_window_length) config.tau = base.window_length() / dims[i];

    LOG("\nsweep " << (i + 1) << " / " << dims.size() << ": " << config);

    Result result;
    run(seq, config, engine, result);

    SweepPoint point;
    point.dim = config.dim;
    point.tau = config.tau;
    point.num_windows = result.cloud.rows();
    point.scores = result.scores;
    points.push_back(point);
  }
}

} // namespace Pipeline
