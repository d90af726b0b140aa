#ifndef HOOP_ARGS_H
#define HOOP_ARGS_H

#include <stdint.h>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <map>

// parses a whole argument as a number, exiting with the help message
// when it is not one
long parse_long (const char * arg, const char * help);
double parse_double (const char * arg, const char * help);

struct Args
{
  int argc;
  char ** argv;
  const char * help;

  class Switch
  {
  public:

    typedef void (* Function)(Args &);
    class Action
    {
      enum Type { NONE, CALL, INT, SIZE_T, FLOAT, DOUBLE, STRING, BOOL, FLAG };
      Type m_type;

      union
      {
        Function m_fun;
        int * m_int;
        size_t * m_size_t;
        float * m_float;
        double * m_double;
        std::string * m_string;
        bool * m_bool;
      };

    public:

      Action ()           : m_type(NONE), m_fun(NULL) {}
      Action (Function f) : m_type(CALL), m_fun(f) {}
      Action (int & i)    : m_type(INT), m_int(& i) {}
      Action (size_t & s) : m_type(SIZE_T), m_size_t(& s) {}
      Action (float & f)  : m_type(FLOAT), m_float(& f) {}
      Action (double & d) : m_type(DOUBLE), m_double(& d) {}
      Action (std::string & s) : m_type(STRING), m_string(& s) {}
      Action (bool & b)   : m_type(BOOL), m_bool(& b) {}

      // a switch that takes no value and sets b = true
      static Action flag (bool & b)
      {
        Action action(b);
        action.m_type = FLAG;
        return action;
      }

      void operator() (Args & args);
    };

  private:

    typedef std::map<std::string, Action> Cases;
    typedef Cases::iterator Case;

    Args & m_args;
    Cases m_cases;
    void print_error (const std::string & message);

  public:

    Switch (Args & args);
    ~Switch () {}

    Switch & case_ (std::string key, Action action);
    void default_ (Action default_action);
    void default_error ();
    void default_break_else_repeat ();
  };

  const char * top () { return * argv; }

public:

  Args (int c, char ** v, const char * h) : argc(c-1), argv(v+1), help(h) {}
  ~Args ();

  size_t size () const { return argc; }

  const char * pop ()
  {
    if (not argc--) {
      std::cout << help << std::endl;
      std::cout << "ERROR too few arguments" << std::endl;
      exit(1);
    }
    return *(argv++);
  }

  const char * pop (const char * default_value)
  {
    if (not argc) return default_value;
    --argc;
    return *(argv++);
  }
  int pop (int default_value)
  {
    if (not argc) return default_value;
    --argc;
    return parse_long(*(argv++), help);
  }
  double pop (double default_value)
  {
    if (not argc) return default_value;
    --argc;
    return parse_double(*(argv++), help);
  }

  std::vector<std::string> pop_all ()
  {
    std::vector<std::string> result;
    while (argc) result.push_back(pop());
    return result;
  }

  void done ()
  {
    if (argc) {
      std::cout << help << std::endl;
      std::cout << "WARNING too many arguments" << std::endl;
    }
  }

  Switch case_ (std::string key, Switch::Action action);
};

inline std::ostream & operator<< (std::ostream & o, const Args & args)
{
  for (int i = 0; i < args.argc; ++i) {
    o << "\n  " << args.argv[i];
  }
  return o << std::flush;
}

#endif // HOOP_ARGS_H
