/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include "strict_conversions.hh"

#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "exception.hh"

using namespace std;

unsigned long int strict_atoui(const string & str, const int base)
{
  if (str.empty()) {
    throw runtime_error("Invalid integer string: empty");
  }

  if (str.front() == '-') {
    throw runtime_error("Invalid unsigned integer: " + str);
  }

  char * end;

  errno = 0;
  unsigned long int ret = strtoul(str.c_str(), &end, base);

  if (errno != 0) {
    throw unix_error("strtoul");
  } else if (end != str.c_str() + str.size()) {
    throw runtime_error("Invalid integer: " + str);
  }

  return ret;
}

string double_to_string(const double input, const int precision)
{
  stringstream stream;
  stream << fixed << setprecision(precision) << input;
  return stream.str();
}
