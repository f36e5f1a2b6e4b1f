#ifndef SAMPLE_WINDOW_HH
#define SAMPLE_WINDOW_HH

#include <cstddef>
#include <deque>

/* bounded FIFO of recent samples; the oldest sample is evicted once full */
class SampleWindow
{
public:
  SampleWindow(const size_t capacity);

  void push(const double value);

  /* arithmetic mean of the held samples, or 0 if empty */
  double mean() const;

  /* most recently pushed sample, or 0 if empty */
  double latest() const;

  size_t size() const { return samples_.size(); }
  size_t capacity() const { return capacity_; }
  bool empty() const { return samples_.empty(); }

private:
  size_t capacity_;
  std::deque<double> samples_ {};
};

#endif /* SAMPLE_WINDOW_HH */
