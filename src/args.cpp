
#include "args.h"
#include <cerrno>
#include <cstdlib>
#include <sstream>

using std::cout;
using std::endl;
using std::string;

//----( parsing )-------------------------------------------------------------

static void parse_error (const char * arg, const char * kind, const char * help)
{
  cout << help << "\nERROR expected " << kind << ", got '" << arg << "'" << endl;
  exit(1);
}

long parse_long (const char * arg, const char * help)
{
  char * end = NULL;
  errno = 0;
  long result = strtol(arg, & end, 10);
  if ((end == arg) or (* end != '\0') or errno) {
    parse_error(arg, "an integer", help);
  }
  return result;
}

double parse_double (const char * arg, const char * help)
{
  char * end = NULL;
  errno = 0;
  double result = strtod(arg, & end);
  if ((end == arg) or (* end != '\0') or errno) {
    parse_error(arg, "a number", help);
  }
  return result;
}

//----( actions )-------------------------------------------------------------

void Args::Switch::Action::operator() (Args & args)
{
  switch (m_type) {
    case NONE: break;
    case CALL: m_fun(args); break;
    case INT: * m_int = parse_long(args.pop(), args.help); break;
    case SIZE_T: {
      const char * arg = args.pop();
      long value = parse_long(arg, args.help);
      if (value < 0) parse_error(arg, "a nonnegative integer", args.help);
      * m_size_t = value;
    } break;
    case FLOAT: * m_float = parse_double(args.pop(), args.help); break;
    case DOUBLE: * m_double = parse_double(args.pop(), args.help); break;
    case STRING: * m_string = args.pop(); break;
    case BOOL: * m_bool = parse_long(args.pop(), args.help); break;
    case FLAG: * m_bool = true; break;
  }
}

//----( switches )------------------------------------------------------------

Args::Switch::Switch (Args & args)
  : m_args(args),
    m_cases()
{}

void Args::Switch::print_error (const string & message)
{
  cout << m_args.help << "\nERROR " << message;
  cout << "\ntry one of:";
  for (Case i = m_cases.begin(); i != m_cases.end(); ++i) {
    cout << " " << i->first;
  }
  cout << endl;
  exit(1);
}

Args::Switch & Args::Switch::case_ (
    string key,
    Args::Switch::Action action)
{
  m_cases[key] = action;
  return * this;
}

void Args::Switch::default_ (Args::Switch::Action default_action)
{
  Action action = default_action;

  if (m_args.size()) {
    string arg = m_args.top();
    Case i = m_cases.find(arg);
    if (i != m_cases.end()) {
      m_args.pop();
      action = i->second;
    }
  }

  action(m_args);
}

void Args::Switch::default_error ()
{
  if (not m_args.size()) print_error("missing command.");

  string arg = m_args.pop();
  Case i = m_cases.find(arg);
  if (i == m_cases.end()) print_error("unknown command: " + arg);

  i->second(m_args);
}

void Args::Switch::default_break_else_repeat ()
{
  while (m_args.size()) {
    string arg = m_args.top();
    Case i = m_cases.find(arg);
    if (i == m_cases.end()) break;
    m_args.pop();
    i->second(m_args);
  }
}

Args::Switch Args::case_ (string key, Args::Switch::Action action)
{
  Switch result(* this);
  result.case_(key, action);
  return result;
}

Args::~Args ()
{
  if (size()) {
    std::ostringstream s;
    s << "WARNING the following arguments were not used:";
    while (size()) s << " " << pop();
    cout << s.str() << endl;
  }
}
