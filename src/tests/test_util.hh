#ifndef TEST_UTIL_HH
#define TEST_UTIL_HH

#include <cmath>
#include <stdexcept>
#include <string>

/* test programs fail by throwing; main() reports and exits non-zero */

inline void check(const bool condition, const std::string & what)
{
  if (not condition) {
    throw std::runtime_error("check failed: " + what);
  }
}

inline void check_near(const double actual, const double expected,
                       const std::string & what, const double tolerance = 1e-6)
{
  if (std::fabs(actual - expected) > tolerance) {
    throw std::runtime_error("check failed: " + what + ": expected "
                             + std::to_string(expected) + ", got "
                             + std::to_string(actual));
  }
}

template<typename E, typename F>
void check_throws(F && func, const std::string & what)
{
  try {
    func();
  } catch (const E &) {
    return;
  }

  throw std::runtime_error("check failed: " + what + " did not throw");
}

#endif /* TEST_UTIL_HH */
