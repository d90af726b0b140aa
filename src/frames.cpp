
#include "frames.h"

namespace Frames
{

//----( frame sequences )-----------------------------------------------------

void FrameSequence::validate () const
{
  ASSERT(shape.size(), "frame sequence has empty shape " << shape);
  ASSERT_COLS(frames, shape.size());
  ASSERT_LT(0, framerate);

  for (int t = 0; t < frames.rows(); ++t) {
    for (int i = 0; i < frames.cols(); ++i) {
      ASSERT(safe_isfinite(frames(t,i)),
          "frame " << t << " pixel " << i << " is not finite: " << frames(t,i));
    }
  }
}

//----( frame files )---------------------------------------------------------

void FrameFile::write (ostream & o) const
{
  m_seq.validate();

  LOG(" writing " << m_seq.size() << " frames of shape " << m_seq.shape);

  o << "\n""frames"
    << "\n width = " << m_seq.shape.width()
    << "\n height = " << m_seq.shape.height()
    << "\n framerate = " << m_seq.framerate;

  write_matrix(m_seq.frames, o);
}

void FrameFile::read (istream & file)
{
  size_t width, height;
  float framerate;

  read_token(file, "frames");
  read_token(file, "width"); read_token(file, "="); file >> width;
  read_token(file, "height"); read_token(file, "="); file >> height;
  read_token(file, "framerate"); read_token(file, "="); file >> framerate;
  ASSERT(not file.fail(), "failed to parse frame header");

  m_seq.shape = Rectangle(width, height);
  m_seq.framerate = framerate;
  read_matrix(m_seq.frames, file);

  m_seq.validate();

  LOG(" read " << m_seq.size() << " frames of shape " << m_seq.shape
      << " at " << m_seq.framerate << " Hz");
}

//----( synthetic sources )---------------------------------------------------

SinusoidSource::SinusoidSource (
    size_t num_frames,
    double period,
    Rectangle shape,
    double phase_spread)
  : m_num_frames(num_frames),
    m_period(period),
    m_shape(shape),
    m_phase_spread(phase_spread)
{
  ASSERT_LT(0, m_period);
  ASSERT_LT(0, m_shape.size());
}

void SinusoidSource::read (FrameSequence & seq)
{
  seq = FrameSequence(m_num_frames, m_shape, DEFAULT_VIDEO_FRAMERATE);

  const size_t P = m_shape.size();
  for (size_t t = 0; t < m_num_frames; ++t) {
    for (size_t i = 0; i < P; ++i) {
      double phase = P > 1 ? m_phase_spread * i / (P - 1) : 0.0;
      seq.frames(t,i) = sin(2 * M_PI * (t / m_period + phase));
    }
  }

  LOG("synthesized " << m_num_frames << " frames of period " << m_period
      << ", shape " << m_shape);
}

BiphonationSource::BiphonationSource (
    size_t num_frames,
    double period1,
    double period2,
    Rectangle shape)
  : m_num_frames(num_frames),
    m_period1(period1),
    m_period2(period2),
    m_shape(shape)
{
  ASSERT_LT(0, m_period1);
  ASSERT_LT(0, m_period2);
  ASSERT_LT(1, m_shape.width());
}

void BiphonationSource::read (FrameSequence & seq)
{
  seq = FrameSequence(m_num_frames, m_shape, DEFAULT_VIDEO_FRAMERATE);

  const size_t W = m_shape.width();
  const size_t H = m_shape.height();
  for (size_t t = 0; t < m_num_frames; ++t) {
    for (size_t y = 0; y < H; ++y) {
      for (size_t x = 0; x < W; ++x) {

        // each half carries a traveling wave so it traces a circle
        bool left = 2 * x < W;
        double period = left ? m_period1 : m_period2;
        double phase = (left ? x : x - W / 2) / double(W) + y / double(H);

        seq.frames(t, x + W * y) = cos(2 * M_PI * (t / period + phase));
      }
    }
  }

  LOG("synthesized " << m_num_frames << " quasiperiodic frames of periods "
      << m_period1 << ", " << m_period2 << ", shape " << m_shape);
}

} // namespace Frames
