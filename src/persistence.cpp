
#include "persistence.h"
#include "cloud_math.h"
#include <algorithm>
#include <cstdlib>
#include <functional>
#include <utility>
#include <gudhi/Simplex_tree.h>
#include <gudhi/Rips_complex.h>
#include <gudhi/Persistent_cohomology.h>

namespace Topology
{

//----( diagrams )------------------------------------------------------------

size_t Diagram::num_essential () const
{
  size_t result = 0;
  for (size_t i = 0; i < intervals.size(); ++i) {
    if (intervals[i].essential()) ++result;
  }
  return result;
}

std::vector<double> Diagram::persistences () const
{
  std::vector<double> result;
  for (size_t i = 0; i < intervals.size(); ++i) {
    if (not intervals[i].essential()) {
      result.push_back(intervals[i].persistence());
    }
  }
  std::sort(result.begin(), result.end(), std::greater<double>());
  return result;
}

void Diagrams::clear (size_t max_dim, int c)
{
  coeff = c;
  dims.clear();
  for (size_t d = 0; d <= max_dim; ++d) {
    dims.push_back(Diagram(d));
  }
}

void Diagrams::print_summary () const
{
  for (size_t d = 0; d < dims.size(); ++d) {
    const Diagram & dgm = dims[d];
    std::vector<double> pers = dgm.persistences();

    LOG(" H" << d << ": " << dgm.size() << " intervals, "
        << dgm.num_essential() << " essential, max persistence "
        << (pers.empty() ? 0.0 : pers.front()));
  }
}

void Diagrams::write (ostream & o) const
{
  LOG(" writing persistence diagrams over Z/" << coeff);

  o << "\n""diagrams"
    << "\n coeff = " << coeff
    << "\n max_dim = " << max_dim();

  const std::streamsize precision = o.precision(17);
  for (size_t d = 0; d < dims.size(); ++d) {
    const std::vector<Interval> & intervals = dims[d].intervals;

    o << "\n  H" << d << " " << intervals.size() << " intervals (birth,death)";
    for (size_t i = 0; i < intervals.size(); ++i) {
      o << "\n   " << intervals[i].birth << " ";
      if (intervals[i].essential()) o << "inf"; else o << intervals[i].death;
    }
  }
  o.precision(precision);
}

void Diagrams::read (istream & file)
{
  size_t max_dim;

  read_token(file, "diagrams");
  read_token(file, "coeff"); read_token(file, "="); file >> coeff;
  read_token(file, "max_dim"); read_token(file, "="); file >> max_dim;
  ASSERT(not file.fail(), "failed to parse diagram header");
  ASSERT_LE(max_dim, PERSISTENCE_MAX_DIM);

  clear(max_dim, coeff);

  for (size_t d = 0; d <= max_dim; ++d) {

    size_t num_intervals;
    read_token(file, "H" + std::to_string(d));
    file >> num_intervals;
    read_token(file, "intervals");
    read_token(file, "(birth,death)");

    for (size_t i = 0; i < num_intervals; ++i) {
      double birth;
      string death;
      file >> birth >> death;
      ASSERT(not file.fail(), "failed to parse interval " << i << " of H" << d);

      dims[d].intervals.push_back(Interval(
          birth,
          death == "inf" ? HUGE_VAL : strtod(death.c_str(), NULL)));
    }
  }
}

//----( rips persistence )----------------------------------------------------

namespace
{

typedef Gudhi::Simplex_tree<> SimplexTree;
typedef SimplexTree::Filtration_value Filtration;
typedef Gudhi::rips_complex::Rips_complex<Filtration> RipsComplex;
typedef Gudhi::persistent_cohomology::Field_Zp Field;
typedef Gudhi::persistent_cohomology::Persistent_cohomology<SimplexTree, Field>
    Cohomology;

} // anonymous namespace

void RipsPersistence::compute (
    const MatrixXd & cloud,
    size_t max_dim,
    int coeff,
    double threshold,
    Diagrams & diagrams)
{
  MatrixXd distances;
  Cloud::pairwise_distances(cloud, distances);

  compute_from_distances(distances, max_dim, coeff, threshold, diagrams);
}

void RipsPersistence::compute_from_distances (
    const MatrixXd & distances,
    size_t max_dim,
    int coeff,
    double threshold,
    Diagrams & diagrams)
{
  ASSERT_LE(max_dim, PERSISTENCE_MAX_DIM);
  ASSERT(is_prime(coeff) and (coeff <= PERSISTENCE_MAX_COEFF),
      "coefficient field must be a prime <= " << PERSISTENCE_MAX_COEFF
      << ", got " << coeff);
  ASSERT(threshold > 0, "rips threshold must be positive, got " << threshold);

  const size_t n = distances.rows();
  ASSERT_COLS(distances, n);

  Timer timer;
  diagrams.clear(max_dim, coeff);
  if (n == 0) return;

  // the rips complex reads the strict lower triangle
  std::vector<std::vector<Filtration> > lower(n);
  for (size_t i = 0; i < n; ++i) {
    lower[i].resize(i);
    for (size_t j = 0; j < i; ++j) {
      lower[i][j] = distances(i,j);
    }
  }

  RipsComplex rips(lower, threshold);
  SimplexTree complex;
  rips.create_complex(complex, max_dim + 1);

  Cohomology cohomology(complex);
  cohomology.init_coefficients(coeff);
  cohomology.compute_persistent_cohomology(0);

  for (size_t d = 0; d <= max_dim; ++d) {
    typedef std::vector<std::pair<Filtration, Filtration> > Pairs;
    Pairs pairs = cohomology.intervals_in_dimension(d);
    std::sort(pairs.begin(), pairs.end());

    std::vector<Interval> & intervals = diagrams.dims[d].intervals;
    for (Pairs::const_iterator i = pairs.begin(); i != pairs.end(); ++i) {
      double death = safe_isfinite(i->second) ? i->second : HUGE_VAL;
      intervals.push_back(Interval(i->first, death));
    }
  }

  LOG("rips persistence: " << n << " points, " << complex.num_simplices()
      << " simplices up to dim " << (max_dim + 1) << ", Z/" << coeff
      << ", threshold " << threshold << ", " << timer.elapsed() << " sec");
}

} // namespace Topology
