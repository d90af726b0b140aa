
#include "common.h"
#include <sys/time.h>

const char * hoop_logo =
"  _\n"
" | |__   ___   ___  _ __\n"
" | '_ \\ / _ \\ / _ \\| '_ \\  Sliding-Window Persistence for Video\n"
" | | | | (_) | (_) | |_) |\n"
" |_| |_|\\___/ \\___/| .__/\n"
"                   |_|";

//----( math )----------------------------------------------------------------

bool is_prime (int n)
{
  if (n < 2) return false;
  for (int d = 2; d * d <= n; ++d) {
    if (n % d == 0) return false;
  }
  return true;
}

//----( time )----------------------------------------------------------------

// time measurement
timeval g_begin_time, g_current_time;
const int g_time_is_available(gettimeofday(&g_begin_time, NULL));
inline void update_time () { gettimeofday(&g_current_time, NULL); }
double get_elapsed_time ()
{
  update_time();
  return g_current_time.tv_sec - g_begin_time.tv_sec
    + 1e-6 * (g_current_time.tv_usec - g_begin_time.tv_usec);
}
