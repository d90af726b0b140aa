
#include "persistence.h"
#include <sstream>

#define TOL (1e-9)

#define ASSERT_CLOSE(x,y) \
  ASSERT(fabs((x)-(y)) < TOL, \
      "expected " #x " close to " #y "; actual difference: " << ((x)-(y)))

using namespace Topology;

void print_diagrams (const Diagrams & diagrams)
{
  for (size_t d = 0; d < diagrams.dims.size(); ++d) {
    const std::vector<Interval> & intervals = diagrams[d].intervals;
    std::ostringstream o;
    for (size_t i = 0; i < intervals.size(); ++i) o << " " << intervals[i];
    LOG(" H" << d << ":" << o.str());
  }
}

void unit_square (MatrixXd & cloud)
{
  cloud.resize(4, 2);
  cloud << 0, 0,
           1, 0,
           1, 1,
           0, 1;
}

// vertices +-e_i of the unit octahedron
void octahedron (MatrixXd & cloud)
{
  cloud.setZero(6, 3);
  for (int i = 0; i < 3; ++i) {
    cloud(2 * i + 0, i) = 1;
    cloud(2 * i + 1, i) = -1;
  }
}

//----( unit tests )----------------------------------------------------------

void test_square (int coeff)
{
  LOG("\ntesting rips persistence of a square over Z/" << coeff);

  MatrixXd cloud;
  unit_square(cloud);

  RipsPersistence engine;
  Diagrams diagrams;
  engine.compute(cloud, 1, coeff, HUGE_VAL, diagrams);
  print_diagrams(diagrams);

  ASSERT_EQ(diagrams.coeff, coeff);
  ASSERT_EQ(diagrams.max_dim(), 1);

  const Diagram & h0 = diagrams[0];
  ASSERT_EQ(h0.size(), 4);
  ASSERT_EQ(h0.num_essential(), 1);
  for (size_t i = 0; i < h0.size(); ++i) {
    ASSERT_EQ(h0.intervals[i].birth, 0);
    if (not h0.intervals[i].essential()) {
      ASSERT_CLOSE(h0.intervals[i].death, 1.0);
    }
  }

  const Diagram & h1 = diagrams[1];
  ASSERT_EQ(h1.size(), 1);
  ASSERT_CLOSE(h1.intervals[0].birth, 1.0);
  ASSERT_CLOSE(h1.intervals[0].death, sqrt(2.0));

  LOG("passed");
}

void test_octahedron (int coeff)
{
  LOG("\ntesting rips persistence of an octahedron over Z/" << coeff);

  MatrixXd cloud;
  octahedron(cloud);

  RipsPersistence engine;
  Diagrams diagrams;
  engine.compute(cloud, 2, coeff, HUGE_VAL, diagrams);
  print_diagrams(diagrams);

  ASSERT_EQ(diagrams.max_dim(), 2);

  ASSERT_EQ(diagrams[0].size(), 6);
  ASSERT_EQ(diagrams[0].num_essential(), 1);

  // the surface closes up as soon as the edges appear
  ASSERT_EQ(diagrams[1].size(), 0);

  const Diagram & h2 = diagrams[2];
  ASSERT_EQ(h2.size(), 1);
  ASSERT_CLOSE(h2.intervals[0].birth, sqrt(2.0));
  ASSERT_CLOSE(h2.intervals[0].death, 2.0);

  LOG("passed");
}

void test_circle (int n = 12)
{
  LOG("\ntesting rips persistence of " << n << " points on a circle");

  // chord lengths by step, so equal steps tie exactly
  MatrixXd distances(n, n);
  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      int step = min(abs(i - j), n - abs(i - j));
      distances(i,j) = 2 * sin(M_PI * step / n);
    }
  }

  RipsPersistence engine;
  Diagrams diagrams;
  engine.compute_from_distances(distances, 1, 2, HUGE_VAL, diagrams);
  diagrams.print_summary();

  ASSERT_EQ(diagrams[0].size(), n);
  ASSERT_EQ(diagrams[0].num_essential(), 1);

  const Diagram & h1 = diagrams[1];
  ASSERT_EQ(h1.size(), 1);
  ASSERT_CLOSE(h1.intervals[0].birth, 2 * sin(M_PI / n));
  ASSERT_CLOSE(h1.intervals[0].death, sqrt(3.0));

  std::vector<double> pers = h1.persistences();
  ASSERT_EQ(pers.size(), 1);
  ASSERT_CLOSE(pers[0], sqrt(3.0) - 2 * sin(M_PI / n));

  LOG("passed");
}

void test_threshold ()
{
  LOG("\ntesting that classes alive at the threshold are essential");

  MatrixXd cloud;
  unit_square(cloud);

  RipsPersistence engine;
  Diagrams diagrams;
  engine.compute(cloud, 1, 2, 1.2, diagrams);
  print_diagrams(diagrams);

  ASSERT_EQ(diagrams[0].num_essential(), 1);
  ASSERT_EQ(diagrams[1].size(), 1);
  ASSERT(diagrams[1].intervals[0].essential(), "expected an essential loop");
  ASSERT_CLOSE(diagrams[1].intervals[0].birth, 1.0);
  ASSERT_EQ(diagrams[1].persistences().size(), 0);

  LOG("passed");
}

void test_small_clouds ()
{
  LOG("\ntesting rips persistence of tiny clouds");

  RipsPersistence engine;
  Diagrams diagrams;

  MatrixXd empty(0, 3);
  engine.compute(empty, 1, 2, HUGE_VAL, diagrams);
  ASSERT_EQ(diagrams.dims.size(), 2);
  ASSERT_EQ(diagrams[0].size(), 0);
  ASSERT_EQ(diagrams[1].size(), 0);

  MatrixXd point = MatrixXd::Zero(1, 3);
  engine.compute(point, 2, 2, HUGE_VAL, diagrams);
  ASSERT_EQ(diagrams.dims.size(), 3);
  ASSERT_EQ(diagrams[0].size(), 1);
  ASSERT_EQ(diagrams[0].num_essential(), 1);

  // coincident points merge immediately, leaving no finite intervals
  MatrixXd twins = MatrixXd::Ones(2, 3);
  engine.compute(twins, 1, 2, HUGE_VAL, diagrams);
  ASSERT_EQ(diagrams[0].size(), 1);
  ASSERT_EQ(diagrams[1].size(), 0);

  LOG("passed");
}

void test_noisy_circle (int n = 100)
{
  LOG("\ntesting rips persistence of " << n << " noisy points up to H2");

  MatrixXd cloud(n, 3);
  for (int i = 0; i < n; ++i) {
    double t = 2 * M_PI * i / n;
    cloud(i,0) = cos(t) + 0.02 * random_std();
    cloud(i,1) = sin(t) + 0.02 * random_std();
    cloud(i,2) = 0.02 * random_std();
  }

  Timer timer;
  RipsPersistence engine;
  Diagrams diagrams;
  engine.compute(cloud, 2, 2, HUGE_VAL, diagrams);
  double elapsed = timer.elapsed();
  diagrams.print_summary();
  PRINT(elapsed);

  ASSERT_EQ(diagrams[0].num_essential(), 1);
  std::vector<double> pers = diagrams[1].persistences();
  ASSERT_LT(0, pers.size());
  ASSERT_LT(1.0, pers[0]);
  for (size_t i = 1; i < pers.size(); ++i) ASSERT_LT(pers[i], 0.5);
  ASSERT_LT(elapsed, 30.0);

  LOG("passed");
}

void test_archive ()
{
  LOG("\ntesting diagram archives");

  MatrixXd cloud;
  octahedron(cloud);
  cloud.row(0) *= 1.1;

  RipsPersistence engine;
  Diagrams diagrams;
  engine.compute(cloud, 2, 5, HUGE_VAL, diagrams);

  string filename = "/tmp/hoop_persistence_test.hoop";
  diagrams.save(filename);

  Diagrams loaded;
  loaded.load(filename);

  ASSERT_EQ(loaded.coeff, 5);
  ASSERT_EQ(loaded.dims.size(), diagrams.dims.size());
  for (size_t d = 0; d < diagrams.dims.size(); ++d) {
    ASSERT_EQ(loaded[d].dim, d);
    ASSERT_EQ(loaded[d].size(), diagrams[d].size());
    for (size_t i = 0; i < diagrams[d].size(); ++i) {
      ASSERT(loaded[d].intervals[i] == diagrams[d].intervals[i],
          "interval " << i << " of H" << d << " changed: "
          << diagrams[d].intervals[i] << " -> " << loaded[d].intervals[i]);
    }
  }

  LOG("passed");
}

//----( test harness )--------------------------------------------------------

int main ()
{
  LOG("Testing persistent homology");

  test_square(2);
  test_square(3);
  test_octahedron(2);
  test_octahedron(3);
  test_circle();
  test_threshold();
  test_small_clouds();
  test_noisy_circle();
  test_archive();

  LOG("\nAll tests passed!");
}
