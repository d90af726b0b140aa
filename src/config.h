#ifndef HOOP_CONFIG_H
#define HOOP_CONFIG_H

#include "common.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>

// digits only; rejects signs, which istream would wrap around for size_t
inline bool is_unsigned_integer (const string & text)
{
  if (text.empty()) return false;
  for (size_t i = 0; i < text.size(); ++i) {
    if (not isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  return true;
}

/** Reads "key = value" lines; '#' starts a comment line.

  Lookups take a default and log every value that differs from it.
*/

class ConfigParser
{
  typedef std::unordered_map<string, string> Dict;
  typedef Dict::const_iterator Auto;
  Dict m_dict;
  const string m_filename;

  template<class T>
  T parse (const string & key, const string & text) const
  {
    std::istringstream s(text);
    T value;
    s >> value;
    ASSERT(not s.fail() and s.eof(), m_filename << ": failed to parse "
        << key << " = " << text);
    return value;
  }

  template<class T>
  T lookup (const string & key, T default_value) const
  {
    Auto i = m_dict.find(key);
    T value = (i == m_dict.end()) ? default_value : parse<T>(key, i->second);
    if (value != default_value) {
      LOG(" " << m_filename << ": " << key << " = " << value
          << " (default = " << default_value << ")");
    }
    return value;
  }

public:

  // an empty parser that returns defaults
  ConfigParser () : m_filename("<defaults>") {}

  explicit ConfigParser (const string & filename)
    : m_filename(filename)
  {
    std::ifstream file(filename);
    ASSERT(file, "failed to open config file " << filename);

    string comment, key, equals, value;
    while (file) {
      int peek = file.peek();
      if (peek == EOF) {
        break;
      } else if (isspace(peek)) {
        file.get();
      } else if (peek == '#') {
        std::getline(file, comment);
      } else {
        file >> key >> equals >> value;
        ASSERT(not file.fail(), filename << ": incomplete entry for " << key);
        ASSERT_EQ(equals, "=");
        m_dict[key] = value;
      }
    }
  }

  const string & filename () const { return m_filename; }
  bool has (const string & key) const { return m_dict.count(key); }
  void set (const string & key, const string & value) { m_dict[key] = value; }

  string operator() (const string & key, string default_value) const
  {
    return lookup<string>(key, default_value);
  }
  string operator() (const string & key, const char * default_value) const
  {
    return lookup<string>(key, default_value);
  }
  int operator() (const string & key, int default_value) const
  {
    return lookup<int>(key, default_value);
  }
  size_t operator() (const string & key, size_t default_value) const
  {
    Auto i = m_dict.find(key);
    if (i != m_dict.end()) {
      ASSERT(is_unsigned_integer(i->second), m_filename
          << ": expected a nonnegative integer for " << key
          << ", got " << i->second);
    }
    return lookup<size_t>(key, default_value);
  }
  double operator() (const string & key, double default_value) const
  {
    return lookup<double>(key, default_value);
  }
  bool operator() (const string & key, bool default_value) const
  {
    return lookup<int>(key, default_value);
  }
};

#endif // HOOP_CONFIG_H
