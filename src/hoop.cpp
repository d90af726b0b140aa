
#include "common.h"
#include "args.h"
#include "config.h"
#include "frames.h"
#include "persistence.h"
#include "periodicity.h"
#include "pipeline.h"
#include <iomanip>

//----( options )-------------------------------------------------------------

Pipeline::Config g_config;

string g_frames_outfile = "data/frames.hoop";
string g_python_outfile = "";
string g_diagrams_outfile = "";

size_t g_num_frames = 200;
double g_period = 30;
double g_period2 = 30 * M_SQRT2;
size_t g_width = 8;
size_t g_height = 8;

bool g_fix_window_length = false;

void option_config (Args & args)
{
  ConfigParser config(args.pop());
  g_config.load(config);
}

void option_no_pca (Args & args) { g_config.use_pca = false; }

// switches shared by every command that runs the pipeline
Args::Switch pipeline_switches (Args & args)
{
  return args
    .case_("-c", option_config)
    .case_("-d", g_config.dim)
    .case_("-t", g_config.tau)
    .case_("-s", g_config.dt)
    .case_("-w", g_config.deriv_win)
    .case_("-r", g_config.pca_rank)
    .case_("-k", g_config.max_dim)
    .case_("-p", g_config.coeff)
    .case_("-x", g_config.threshold)
    .case_("--center", Args::Switch::Action::flag(g_config.pca_center))
    .case_("--no-pca", option_no_pca);
}

void load_frames (Args & args, Frames::FrameSequence & seq)
{
  Frames::FrameFile file(args.pop());
  file.read(seq);
}

//----( synthesis )-----------------------------------------------------------

void save_frames (Frames::FrameSource & source)
{
  Frames::FrameSequence seq;
  source.read(seq);

  Frames::FrameFile(seq).save(g_frames_outfile);
}

void run_synth_sine (Args & args)
{
  Frames::SinusoidSource source(
      g_num_frames,
      g_period,
      Rectangle(g_width, g_height));
  save_frames(source);
}

void run_synth_biphonation (Args & args)
{
  Frames::BiphonationSource source(
      g_num_frames,
      g_period,
      g_period2,
      Rectangle(g_width, g_height));
  save_frames(source);
}

void run_synth (Args & args)
{
  args
    .case_("-n", g_num_frames)
    .case_("-p", g_period)
    .case_("-q", g_period2)
    .case_("-w", g_width)
    .case_("-h", g_height)
    .case_("-o", g_frames_outfile)
    .default_break_else_repeat();

  args
    .case_("sine", run_synth_sine)
    .case_("biphonation", run_synth_biphonation)
    .default_error();
}

//----( analysis )------------------------------------------------------------

void run_embed (Args & args)
{
  pipeline_switches(args)
    .case_("-o", g_python_outfile)
    .default_break_else_repeat();

  Frames::FrameSequence seq;
  load_frames(args, seq);

  LOG("embedding with " << g_config);

  Pipeline::Result result;
  Pipeline::embed(seq, g_config, result);

  if (not g_python_outfile.empty()) {
    save_to_python(result.cloud, g_python_outfile);
  }
}

void run_analyze (Args & args)
{
  pipeline_switches(args)
    .case_("-o", g_diagrams_outfile)
    .case_("-y", g_python_outfile)
    .default_break_else_repeat();

  Frames::FrameSequence seq;
  load_frames(args, seq);

  LOG("analyzing with " << g_config);

  Topology::RipsPersistence engine;
  Pipeline::Result result;
  Pipeline::run(seq, g_config, engine, result);

  if (not g_diagrams_outfile.empty()) {
    result.diagrams.save(g_diagrams_outfile);
  }
  if (not g_python_outfile.empty()) {
    save_to_python(result.cloud, g_python_outfile);
  }
}

void run_sweep (Args & args)
{
  pipeline_switches(args)
    .case_("--fix-length", Args::Switch::Action::flag(g_fix_window_length))
    .default_break_else_repeat();

  Frames::FrameSequence seq;
  load_frames(args, seq);

  std::vector<size_t> dims;
  std::vector<string> dim_args = args.pop_all();
  for (size_t i = 0; i < dim_args.size(); ++i) {
    long dim = parse_long(dim_args[i].c_str(), args.help);
    ASSERT(dim > 0, "window dimensions must be positive, got " << dim);
    dims.push_back(dim);
  }
  if (dims.empty()) dims.push_back(g_config.dim);

  Topology::RipsPersistence engine;
  std::vector<Pipeline::SweepPoint> points;
  Pipeline::sweep(seq, g_config, dims, g_fix_window_length, engine, points);

  LOG("\n   dim        tau  windows  max persistence  periodicity");
  for (size_t i = 0; i < points.size(); ++i) {
    const Pipeline::SweepPoint & p = points[i];
    LOG(std::setw(6) << p.dim
        << std::setw(11) << p.tau
        << std::setw(9) << p.num_windows
        << std::setw(17) << p.scores.max_persistence
        << std::setw(13) << p.scores.periodicity);
  }
}

//----( harness )-------------------------------------------------------------

const char * help_message =
"Usage: hoop COMMAND [OPTIONS] [ARGS]"
"\nCommands:"
"\n  help"
"\n  synth [-n FRAMES -p PERIOD -q PERIOD2 -w WIDTH -h HEIGHT -o FRAMEFILE]"
"\n    sine"
"\n    biphonation"
"\n  embed [PIPELINE_OPTIONS -o PYTHONFILE] FRAMEFILE"
"\n  analyze [PIPELINE_OPTIONS -o DIAGRAMFILE -y PYTHONFILE] FRAMEFILE"
"\n  sweep [PIPELINE_OPTIONS --fix-length] FRAMEFILE [DIMS...]"
"\nPipeline options:"
"\n  -c CONFIGFILE   key = value settings, overridden by later options"
"\n  -d DIM          frames per window"
"\n  -t TAU          delay between frames in a window"
"\n  -s DT           stride between windows"
"\n  -w DERIV_WIN    time derivative width, 0 = off"
"\n  -r RANK         pca rank, 0 = numerical rank"
"\n  --center        subtract the mean frame before pca"
"\n  --no-pca        embed raw pixels"
"\n  -k MAX_DIM      largest homology dimension, 0..2"
"\n  -p COEFF        prime coefficient field"
"\n  -x THRESHOLD    largest rips diameter"
;

void run_help (Args & args) { LOG(help_message); }

int main (int argc, char ** argv)
{
  LOG(hoop_logo);

  Args args(argc, argv, help_message);

  args
    .case_("help", run_help)
    .case_("synth", run_synth)
    .case_("embed", run_embed)
    .case_("analyze", run_analyze)
    .case_("sweep", run_sweep)
    .default_(run_help);

  return 0;
}
