#ifndef HOOP_PIPELINE_H
#define HOOP_PIPELINE_H

#include "common.h"
#include "eigen.h"
#include "config.h"
#include "frames.h"
#include "persistence.h"
#include "periodicity.h"
#include <vector>

namespace Pipeline
{

//----( configuration )-------------------------------------------------------

struct Config
{
  size_t dim;         // frames per window
  double tau;         // delay between frames in a window, in frames
  double dt;          // stride between windows, in frames
  size_t deriv_win;   // time derivative width, 0 disables the filter
  bool use_pca;       // compress frames before embedding
  size_t pca_rank;    // 0 keeps the numerical rank
  bool pca_center;    // subtract the mean frame before pca
  size_t max_dim;     // largest homology dimension, 0..2
  int coeff;          // prime coefficient field
  double threshold;   // largest rips diameter

  Config ()
    : dim(10),
      tau(1),
      dt(1),
      deriv_win(0),
      use_pca(true),
      pca_rank(0),
      pca_center(false),
      max_dim(DEFAULT_MAX_HOMOLOGY_DIM),
      coeff(DEFAULT_COEFF_FIELD),
      threshold(HUGE_VAL)
  {}

  // overrides fields present in the config file
  void load (const ConfigParser & config);

  // aborts with the offending field on invalid values
  void validate () const;

  // frames spanned by one window
  double window_length () const { return dim * tau; }
};

ostream & operator<< (ostream & o, const Config & config);

//----( analysis )------------------------------------------------------------

struct Result
{
  MatrixXd coords;                    // rect(N', P), compressed frames
  std::vector<size_t> valid_frames;   // input frame of each coords row
  MatrixXd cloud;                     // rect(M, dim P), normalized windows
  std::vector<size_t> degenerate;     // windows dropped as constant
  Topology::Diagrams diagrams;
  Periodicity::Scores scores;

  bool empty () const { return cloud.rows() == 0; }
};

// compression, filtering, embedding and normalization
void embed (
    const Frames::FrameSequence & seq,
    const Config & config,
    Result & result);

// embed, then persistence and scores; an empty cloud skips persistence
void run (
    const Frames::FrameSequence & seq,
    const Config & config,
    Topology::PersistenceEngine & engine,
    Result & result);

//----( parameter sweeps )----------------------------------------------------

struct SweepPoint
{
  size_t dim;
  double tau;
  size_t num_windows;
  Periodicity::Scores scores;
};

/** Runs the pipeline once per window dimension, keeping the window length
  dim * tau fixed at the base config's when fix_window_length is set.
  Geometries that do not fit yield zero windows and zero scores.
*/
void sweep (
    const Frames::FrameSequence & seq,
    const Config & base,
    const std::vector<size_t> & dims,
    bool fix_window_length,
    Topology::PersistenceEngine & engine,
    std::vector<SweepPoint> & points);

} // namespace Pipeline

#endif // HOOP_PIPELINE_H
