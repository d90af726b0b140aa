#ifndef HOOP_ARCHIVE_H
#define HOOP_ARCHIVE_H

#include "common.h"
#include "eigen.h"

//----( text archives )-------------------------------------------------------

/** Plain-text archive format shared by frame files, point clouds and
  persistence diagrams:

    hoop archive file
    version 1
    <kind-specific body, written by write()>
    end
*/

struct Archived
{
  mutable string filestem;

  Archived () : filestem("default") {}
  virtual ~Archived () {}

  void save (string filename) const;
  void load (string filename);

  virtual void write (ostream & o) const = 0;
  virtual void read (istream & file) = 0;
};

void write_matrix (const MatrixXd & A, ostream & o);
void read_matrix (MatrixXd & A, istream & file);

// reads one expected keyword, aborting on mismatch
void read_token (istream & file, const string & expected);

#endif // HOOP_ARCHIVE_H
