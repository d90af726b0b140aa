#ifndef HOOP_PERSISTENCE_H
#define HOOP_PERSISTENCE_H

#include "common.h"
#include "eigen.h"
#include "archive.h"
#include <vector>

#define PERSISTENCE_MAX_DIM             (2)
#define PERSISTENCE_MAX_COEFF           (32749)

namespace Topology
{

//----( diagrams )------------------------------------------------------------

struct Interval
{
  double birth;
  double death; // +infinity for essential classes

  Interval () : birth(0), death(0) {}
  Interval (double b, double d) : birth(b), death(d) {}

  bool essential () const { return not safe_isfinite(death); }
  double persistence () const { return death - birth; }

  bool operator== (const Interval & other) const
  {
    return (birth == other.birth) and (death == other.death);
  }
};

inline ostream & operator<< (ostream & o, const Interval & i)
{
  return o << "[" << i.birth << ", " << i.death << ")";
}

struct Diagram
{
  size_t dim;
  std::vector<Interval> intervals;

  explicit Diagram (size_t d = 0) : dim(d) {}

  size_t size () const { return intervals.size(); }
  size_t num_essential () const;

  // finite persistences, largest first
  std::vector<double> persistences () const;
};

struct Diagrams : public Archived
{
  int coeff;
  std::vector<Diagram> dims;

  Diagrams () : coeff(DEFAULT_COEFF_FIELD) {}

  size_t max_dim () const { return dims.size() - 1; }
  const Diagram & operator[] (size_t d) const { return dims[d]; }

  void clear (size_t max_dim, int c);
  void print_summary () const;

  virtual void write (ostream & o) const;
  virtual void read (istream & file);
};

//----( engines )------------------------------------------------------------

/** Persistent homology of a point cloud, one diagram per dimension
  0 .. max_dim, with coefficients in the prime field Z/coeff.
  The filtration is capped at threshold; classes still alive there are
  reported as essential.
*/
class PersistenceEngine
{
public:
  virtual ~PersistenceEngine () {}

  virtual void compute (
      const MatrixXd & cloud,  // rect(M, D), one point per row
      size_t max_dim,
      int coeff,
      double threshold,
      Diagrams & diagrams) = 0;
};

/** Vietoris-Rips persistence computed by GUDHI.

  The Rips complex of the Euclidean distance matrix is expanded to
  dimension max_dim + 1 and its persistent cohomology computed over
  Z/coeff. Pairs of zero persistence are not reported.
*/
class RipsPersistence : public PersistenceEngine
{
public:

  virtual ~RipsPersistence () {}

  virtual void compute (
      const MatrixXd & cloud,
      size_t max_dim,
      int coeff,
      double threshold,
      Diagrams & diagrams);

  // same as compute, from a precomputed symmetric distance matrix
  void compute_from_distances (
      const MatrixXd & distances,
      size_t max_dim,
      int coeff,
      double threshold,
      Diagrams & diagrams);
};

} // namespace Topology

#endif // HOOP_PERSISTENCE_H
