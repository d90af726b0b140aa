
#include "periodicity.h"

namespace Periodicity
{

double max_persistence (const Topology::Diagram & diagram, size_t rank)
{
  std::vector<double> pers = diagram.persistences();
  return rank < pers.size() ? pers[rank] : 0.0;
}

double periodicity_score (const Topology::Diagrams & diagrams)
{
  ASSERT(diagrams.dims.size() > 1, "periodicity needs H1 diagrams");

  double score = max_persistence(diagrams[1]) / MAX_UNIT_PERSISTENCE;
  return bound_to(0.0, 1.0, score);
}

double quasiperiodicity_score (const Topology::Diagrams & diagrams)
{
  ASSERT(diagrams.dims.size() > 2, "quasiperiodicity needs H2 diagrams");

  double h1 = max_persistence(diagrams[1], 1);
  double h2 = max_persistence(diagrams[2], 0);
  return bound_to(0.0, 1.0, sqrt(h1 * h2 / 3));
}

void score (const Topology::Diagrams & diagrams, Scores & scores)
{
  scores = Scores();
  if (diagrams.dims.size() < 2) return;

  scores.max_persistence = max_persistence(diagrams[1]);
  scores.periodicity = periodicity_score(diagrams);
  if (diagrams.dims.size() > 2) {
    scores.quasiperiodicity = quasiperiodicity_score(diagrams);
  }
}

} // namespace Periodicity
