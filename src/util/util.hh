#ifndef UTIL_HH
#define UTIL_HH

#include <string>

/* expand a leading "~" to the current user's home directory */
std::string expand_user(const std::string & path);

#endif /* UTIL_HH */
