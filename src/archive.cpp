
#include "archive.h"
#include <fstream>

#define PARSE(type, variable) \
  type variable; \
  file >> variable; \
  ASSERT(not file.fail(), \
      "failed to parse variable '" #variable "' of type " #type);

//----( text archives )-------------------------------------------------------

static const int FILE_VERSION = 1;

void read_token (istream & file, const string & expected)
{
  string tok;
  file >> tok;
  ASSERT(not file.fail(), "failed to read expected token '" << expected << "'");
  ASSERT_EQ(tok, expected);
}

void write_matrix (const MatrixXd & A, ostream & o)
{
  LOG("  writing " << shape_of(A) << " dense matrix");

  o << "\n  Matrix<double>"
    << "\n   shape = " << A.rows() << " " << A.cols();

  const std::streamsize precision = o.precision(17);
  for (int i = 0; i < A.rows(); ++i) {
    o << "\n  ";
    for (int j = 0; j < A.cols(); ++j) {
      o << " " << A(i,j);
    }
  }
  o.precision(precision);
}

void read_matrix (MatrixXd & A, istream & file)
{
  read_token(file, "Matrix<double>");
  read_token(file, "shape");
  read_token(file, "=");
  PARSE(int, I) PARSE(int, J)
  ASSERT_NONNEG(I);
  ASSERT_NONNEG(J);

  LOG("  reading " << I << " x " << J << " dense matrix");

  A.resize(I,J);
  for (int i = 0; i < I; ++i) {
    for (int j = 0; j < J; ++j) {
      PARSE(double, value)
      A(i,j) = value;
    }
  }
}

void Archived::save (string filename) const
{
  LOG("saving to file " << filename);
  filestem = filename;

  std::ofstream o(filename);
  ASSERT(o, "failed to open " << filename << " for writing");

  o << "hoop archive file";

  o << "\n""version " << FILE_VERSION;

  write(o);

  o << "\n"
    << "\n""end"
    << "\n";

  ASSERT(o, "failed to write " << filename);
}

void Archived::load (string filename)
{
  LOG("loading from file " << filename);

  std::ifstream file(filename);
  ASSERT(file, "failed to open " << filename);

  read_token(file, "hoop");
  read_token(file, "archive");
  read_token(file, "file");

  read_token(file, "version");
  PARSE(int, version)
  ASSERT_EQ(version, FILE_VERSION);

  read(file);

  read_token(file, "end");

  filestem = filename;
}
