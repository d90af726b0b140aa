#ifndef HOOP_COMMON_H
#define HOOP_COMMON_H

#include <cstdlib>  // for exit() & abort();
#include <iostream>
#include <string>
#include <cmath>
#include <cstdint>

using std::cout;
using std::cerr;
using std::endl;
using std::ostream;
using std::istream;
using std::string;

extern const char * hoop_logo;

//----( global parameters )---------------------------------------------------

#define DEFAULT_VIDEO_FRAMERATE         (30.0f)
#define DEFAULT_COEFF_FIELD             (2)
#define DEFAULT_MAX_HOMOLOGY_DIM        (1)

// largest persistence of a loop in a centered unit-norm cloud
#define MAX_UNIT_PERSISTENCE            (sqrt(3.0))

//----( logging )-------------------------------------------------------------

#define LOG(mess) { cout << mess << endl; }
#define PRINT(arg) LOG(#arg " = " << (arg))

#define ERROR(mess) {\
    cerr << "ERROR "\
         << mess << "\n\t"\
         << __FILE__ << " : " << __LINE__ << "\n\t"\
         << __PRETTY_FUNCTION__ << endl; \
    abort(); }

#define WARN(mess) {\
    cerr << "WARNING "\
         << mess << "\n\t"\
         << __FILE__ << " : " << __LINE__ << "\n\t"\
         << __PRETTY_FUNCTION__ << endl; }

#define ASSERT(cond, mess) { if (!(cond)) ERROR(mess); }
#define ASSERTW(cond, mess) { if (!(cond)) WARN(mess); }

#define ASSERT_EQ(x,y) ASSERT((x) == (y), \
    "expected " #x " = " #y ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_LT(x,y) ASSERT((x) < (y), \
    "expected " #x " < " #y ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_LE(x,y) ASSERT((x) <= (y), \
    "expected " #x " <= " #y ",\n\tactual: " << (x) << " vs " << (y))
#define ASSERT_NONNEG(x) ASSERT(0 <= x, \
    "expected " #x " nonnegative,\n\tactual: " << (x))
#define ASSERT_FINITE(x) ASSERT(safe_isfinite(x), \
    "expected " #x " finite,\n\tactual: " << (x))

// shape checks at stage boundaries
#define ASSERT_ROWS(mat, num_rows) \
  ASSERT(static_cast<size_t>((mat).rows()) == static_cast<size_t>(num_rows), \
      "matrix '" # mat "' has wrong number of rows " \
      << (mat).rows() << ",\n\tshould be " << (num_rows))
#define ASSERT_COLS(mat, num_cols) \
  ASSERT(static_cast<size_t>((mat).cols()) == static_cast<size_t>(num_cols), \
      "matrix '" # mat "' has wrong number of columns " \
      << (mat).cols() << ",\n\tshould be " << (num_cols))

#ifndef HOOP_NDEBUG
  #define ASSERT1(cond, mess) ASSERT(cond, mess)
  #define ASSERT1_LT(x,y) ASSERT_LT(x,y)
#else // HOOP_NDEBUG
  #define ASSERT1(cond, mess)
  #define ASSERT1_LT(x,y)
#endif // HOOP_NDEBUG

// time
double get_elapsed_time ();

class Timer
{
  double m_time;
public:
  Timer () { reset(); }
  void reset () { m_time = get_elapsed_time(); }
  double elapsed () const { return get_elapsed_time() - m_time; }
};

//----( datatypes )-----------------------------------------------------------

// these make finiteness testing safe even after optimization

inline bool safe_isfinite (double x)
{
  return (-HUGE_VAL < x) and (x < HUGE_VAL);
}

//----( math )----------------------------------------------------------------

template<class T> inline T min (T x, T y) { return (x < y) ? x : y; }
template<class T> inline T max (T x, T y) { return (x > y) ? x : y; }
template<class T> inline void imax (T & x, const T & y) { if (y > x) x = y; }

template<class T> inline T bound_to (T LB, T UB, T x)
{
  return max(LB, min(UB, x));
}

template <class T> inline T sqr (const T& x) { return x*x; }

bool is_prime (int n);

//----( random generators )---------------------------------------------------

inline uint32_t random_int () { return random(); }
inline uint32_t random_max () { return RAND_MAX; }

inline double random_std ()
{
  // zero mean, unit variance
  const double scale = sqrt(12.0) / random_max();
  const double shift = -sqrt(12.0) / 2.0;
  return random_int() * scale + shift;
}

//----( common structures )---------------------------------------------------

class Rectangle
{
protected:

  size_t m_width;
  size_t m_height;

public:

  Rectangle (size_t width, size_t height) : m_width(width), m_height(height) {}

  size_t size () const { return m_width * m_height; }
  size_t width () const { return m_width; }
  size_t height () const { return m_height; }

  bool operator== (const Rectangle & other) const
  {
    return (other.m_width == m_width) and (other.m_height == m_height);
  }
  bool operator!= (const Rectangle & other) const
  {
    return (other.m_width != m_width) or (other.m_height != m_height);
  }

  friend inline ostream & operator<< (ostream & o, const Rectangle & r)
  {
    return o << "Rectangle(" << r.width() << ", " << r.height() << ")";
  }
};

#endif // HOOP_COMMON_H
