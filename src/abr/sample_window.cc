#include "sample_window.hh"

#include <numeric>
#include <stdexcept>

using namespace std;

SampleWindow::SampleWindow(const size_t capacity)
  : capacity_(capacity)
{
  if (capacity_ == 0) {
    throw invalid_argument("SampleWindow: capacity must be positive");
  }
}

void SampleWindow::push(const double value)
{
  samples_.push_back(value);
  if (samples_.size() > capacity_) {
    samples_.pop_front();
  }
}

double SampleWindow::mean() const
{
  if (samples_.empty()) {
    return 0;
  }

  return accumulate(samples_.begin(), samples_.end(), 0.0) / samples_.size();
}

double SampleWindow::latest() const
{
  if (samples_.empty()) {
    return 0;
  }

  return samples_.back();
}
