#include "util.hh"

#include <cstdlib>
#include <unistd.h>
#include <sys/types.h>
#include <pwd.h>

#include <stdexcept>

using namespace std;

static string home_dir()
{
  const char * home = getenv("HOME");
  if (home and *home) {
    return home;
  }

  const struct passwd * pw = getpwuid(getuid());
  if (not pw) {
    throw runtime_error("no home directory for user id " + to_string(getuid()));
  }

  return pw->pw_dir;
}

string expand_user(const string & path)
{
  if (path.empty() or path.front() != '~') {
    return path;
  }

  if (path.size() > 1 and path[1] != '/') {
    throw runtime_error("expand_user: only ~ and ~/ are supported: " + path);
  }

  return home_dir() + path.substr(1);
}
