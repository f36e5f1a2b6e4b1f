#include <cstdlib>
#include <iostream>

#include "exception.hh"
#include "sample_window.hh"
#include "test_util.hh"

using namespace std;

void test_fifo_eviction()
{
  SampleWindow window(5);

  for (const double v : {10, 20, 30, 40, 50, 60}) {
    window.push(v);
  }

  check(window.size() == 5, "window holds at most its capacity");
  check_near(window.mean(), 40, "mean of the last five samples");
  check_near(window.latest(), 60, "latest sample");
}

void test_empty()
{
  SampleWindow window(10);

  check(window.empty(), "new window is empty");
  check_near(window.mean(), 0, "mean of an empty window");
  check_near(window.latest(), 0, "latest of an empty window");

  check_throws<invalid_argument>([]() { SampleWindow bad(0); },
                                 "zero capacity");
}

void test_partial_fill()
{
  SampleWindow window(10);
  window.push(0.1);
  window.push(0.3);

  check(window.size() == 2, "two samples held");
  check_near(window.mean(), 0.2, "mean before the window is full");
}

int main(int argc, char * argv[])
{
  if (argc < 1) {
    abort();
  }

  try {
    test_fifo_eviction();
    test_empty();
    test_partial_fill();
  } catch (const exception & e) {
    print_exception(argv[0], e);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
