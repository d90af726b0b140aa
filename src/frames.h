#ifndef HOOP_FRAMES_H
#define HOOP_FRAMES_H

#include "common.h"
#include "eigen.h"
#include "archive.h"

namespace Frames
{

//----( frame sequences )-----------------------------------------------------

/** A decoded video, one row per frame.

  frames(t, x + width * y) is the intensity of pixel (x,y) at frame t.
*/

struct FrameSequence
{
  MatrixXd frames;
  Rectangle shape;
  float framerate;

  FrameSequence () : shape(0,0), framerate(DEFAULT_VIDEO_FRAMERATE) {}
  FrameSequence (size_t num_frames, Rectangle s, float rate)
    : frames(num_frames, s.size()),
      shape(s),
      framerate(rate)
  {}

  size_t size () const { return frames.rows(); }
  size_t num_pixels () const { return frames.cols(); }

  // aborts unless every frame has width * height pixels
  void validate () const;
};

//----( sources )-------------------------------------------------------------

class FrameSource
{
public:
  virtual ~FrameSource () {}
  virtual void read (FrameSequence & seq) = 0;
};

class FrameFile
  : public FrameSource,
    public Archived
{
  FrameSequence m_seq;

public:

  FrameFile () {}
  explicit FrameFile (string filename) { load(filename); }
  explicit FrameFile (const FrameSequence & seq) : m_seq(seq) {}

  const FrameSequence & sequence () const { return m_seq; }

  virtual void read (FrameSequence & seq) { seq = m_seq; }

  virtual void write (ostream & o) const;
  virtual void read (istream & file);
};

// Every pixel oscillates as sin(2 pi (t / period + phase(pixel))),
// with phases spread linearly across the frame.
class SinusoidSource : public FrameSource
{
  const size_t m_num_frames;
  const double m_period;
  const Rectangle m_shape;
  const double m_phase_spread;

public:

  SinusoidSource (
      size_t num_frames,
      double period,
      Rectangle shape = Rectangle(1,1),
      double phase_spread = 0.5);
  virtual ~SinusoidSource () {}

  virtual void read (FrameSequence & seq);
};

/** Quasiperiodic video with two incommensurate frequencies.

  The left half of the frame oscillates with period1, the right half with
  period2; an observer of the whole frame sees a torus-like trajectory.
*/
class BiphonationSource : public FrameSource
{
  const size_t m_num_frames;
  const double m_period1;
  const double m_period2;
  const Rectangle m_shape;

public:

  BiphonationSource (
      size_t num_frames,
      double period1,
      double period2,
      Rectangle shape = Rectangle(8,8));
  virtual ~BiphonationSource () {}

  virtual void read (FrameSequence & seq);
};

} // namespace Frames

#endif // HOOP_FRAMES_H
