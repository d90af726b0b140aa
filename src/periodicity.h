#ifndef HOOP_PERIODICITY_H
#define HOOP_PERIODICITY_H

#include "common.h"
#include "persistence.h"

namespace Periodicity
{

// rank-th largest finite persistence (rank 0 is the largest), or 0
double max_persistence (const Topology::Diagram & diagram, size_t rank = 0);

/** Periodicity score in [0,1].

  Largest H1 persistence relative to sqrt(3), the persistence of a perfect
  circle in a centered unit-norm sliding-window cloud.
*/
double periodicity_score (const Topology::Diagrams & diagrams);

/** Quasiperiodicity score in [0,1].

  A torus carries two independent loops and one void, so this is
    sqrt(mp2(H1) mp1(H2) / 3),
  mp2(H1) the second largest H1 persistence and mp1(H2) the largest H2
  persistence. Requires diagrams up to dimension 2.
*/
double quasiperiodicity_score (const Topology::Diagrams & diagrams);

struct Scores
{
  double max_persistence;
  double periodicity;
  double quasiperiodicity; // negative when H2 was not computed

  Scores () : max_persistence(0), periodicity(0), quasiperiodicity(-1) {}
};

void score (const Topology::Diagrams & diagrams, Scores & scores);

inline ostream & operator<< (ostream & o, const Scores & s)
{
  o << "max persistence = " << s.max_persistence
    << ", periodicity = " << s.periodicity;
  if (s.quasiperiodicity >= 0) {
    o << ", quasiperiodicity = " << s.quasiperiodicity;
  }
  return o;
}

} // namespace Periodicity

#endif // HOOP_PERIODICITY_H
