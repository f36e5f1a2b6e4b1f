#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "clock.hh"
#include "exception.hh"
#include "filesystem.hh"
#include "metric_log.hh"
#include "metrics_recorder.hh"
#include "test_util.hh"

using namespace std;

static const Representation low {"low", 1000000};
static const Representation high {"high", 4000000};

SegmentObservation make_obs(const uint64_t segment_index,
                            const Representation & repr,
                            const uint64_t byte_count,
                            const double elapsed_s,
                            const bool is_final)
{
  SegmentObservation obs;
  obs.segment_index = segment_index;
  obs.representation_id = repr.id;
  obs.byte_count = byte_count;
  obs.elapsed_s = elapsed_s;
  obs.is_final = is_final;
  return obs;
}

vector<string> read_lines(const fs::path & path)
{
  ifstream file(path);
  if (not file) {
    throw runtime_error("cannot open " + path.string());
  }

  vector<string> lines;
  string line;
  while (getline(file, line)) {
    lines.emplace_back(line);
  }

  return lines;
}

/* scratch directory removed on scope exit */
class TempDir
{
public:
  TempDir()
    : path_(fs::temp_directory_path()
            / ("abrctl-test-" + to_string(getpid())))
  {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }

  ~TempDir()
  {
    error_code ec;
    fs::remove_all(path_, ec);
  }

  const fs::path & path() const { return path_; }

private:
  fs::path path_;
};

void test_records()
{
  ManualClock clock(1000);
  MetricsRecorder recorder(2.0, clock, nullptr);

  /* 250 kB in 1 s = 2 Mbps; the startup stall is detected and resolved */
  const auto r0 = recorder.record(make_obs(0, low, 250000, 1.0, true), low, 0.1);
  check_near(r0.throughput_bps, 2000000, "throughput from bytes and time");
  check_near(r0.smoothed_throughput_bps, 2000000, "smoothed over one sample");
  check_near(r0.rtt_estimate_s, 0.1, "RTT over one sample");
  check_near(r0.buffer_level_s, 2, "credited one segment");
  check(r0.is_rebuffering, "startup stall");
  check(r0.rebuffer_count == 1, "startup stall counted");
  check_near(r0.playback_position_s, 0, "position of segment 0");
  check(not r0.bitrate_switch, "first record is never a switch");
  check_near(r0.goodput_bps, 1000000, "goodput capped at the bitrate");
  check_near(r0.loss_estimate, 0, "no loss estimate from one sample");
  check(r0.is_complete, "final observation");

  const auto r1 = recorder.record(make_obs(1, low, 125000, 1.0, true), low, 0.3);
  check_near(r1.throughput_bps, 1000000, "second throughput");
  check_near(r1.smoothed_throughput_bps, 1500000, "window mean");
  check_near(r1.rtt_estimate_s, 0.2, "RTT window mean");
  check_near(r1.buffer_level_s, 3, "debit 1 s, credit 2 s");
  check_near(r1.playback_position_s, 2, "position of segment 1");
  check_near(r1.loss_estimate, 1.0 / 3, "deviation from the window mean");

  /* an observation with no elapsed time contributes no throughput sample */
  const auto r2 = recorder.record(make_obs(2, high, 0, 0, false), high, 0);
  check_near(r2.throughput_bps, 0, "zero elapsed time");
  check(recorder.throughput_window().size() == 2, "nothing pushed");
  check(r2.bitrate_switch, "low -> high is a switch");
  check_near(r2.buffer_level_s, 3, "partial without time debits nothing");
  check_near(r2.playback_position_s, 2, "position moves only on completion");
  check(not r2.is_complete, "partial observation");

  /* cumulative elapsed time: only the increment is debited */
  const auto r3 = recorder.record(make_obs(2, high, 1000000, 2.0, true),
                                  high, 0.2);
  check_near(r3.throughput_bps, 4000000, "throughput of segment 2");
  check_near(r3.buffer_level_s, 3, "debit 2 s, credit 2 s");
  check(not r3.bitrate_switch, "same representation");
  check_near(r3.goodput_bps, 4000000, "goodput at the bitrate");
  check_near(r3.playback_position_s, 4, "position of segment 2");

  check(recorder.records().size() == 4, "one record per observation");
  check(recorder.bitrate_switches() == 1, "one switch");

  const auto summary = recorder.summarize();
  check(summary.record_count == 4, "summary record count");
  check(summary.completed_segments == 3, "completed segments");
  check(summary.timed_out_segments == 0, "no timeouts");
  check(summary.rebuffer_count == 1, "summary rebuffers");
  check_near(summary.min_throughput_bps, 1000000, "min throughput");
  check_near(summary.max_throughput_bps, 4000000, "max throughput");
  check_near(summary.mean_throughput_bps, 7000000.0 / 3, "mean throughput");
  check_near(summary.goodput_efficiency, 6.0 / 7, "goodput efficiency");
  check_near(summary.min_rtt_s, 0.1, "min RTT");
  check_near(summary.max_rtt_s, 0.2, "max RTT");
  check_near(summary.min_buffer_s, 2, "min buffer");
  check_near(summary.max_buffer_s, 3, "max buffer");
  check_near(summary.mean_buffer_s, 2.75, "mean buffer");
  check(summary.bitrate_switches == 1, "summary switches");
}

void test_rejected_observations()
{
  ManualClock clock;
  MetricsRecorder recorder(2.0, clock, nullptr);

  check_throws<invalid_argument>(
      [&recorder]() { recorder.record(make_obs(0, low, 10, -1, true), low, 0); },
      "negative elapsed time");
  check_throws<invalid_argument>(
      [&recorder]() { recorder.record(make_obs(0, low, 10, 1, true), high, 0); },
      "observation for another representation");
  check_throws<invalid_argument>(
      [&recorder]() { recorder.record(make_obs(0, low, 10, 1, true), low, -1); },
      "negative RTT sample");

  recorder.record(make_obs(0, low, 10, 1.0, false), low, 0);
  check_throws<invalid_argument>(
      [&recorder]() { recorder.record(make_obs(0, low, 20, 0.5, false), low, 0); },
      "elapsed time going backwards");

  check(recorder.records().size() == 1, "rejected observations leave no record");

  check_throws<invalid_argument>(
      [&clock]() { MetricsRecorder bad(0, clock, nullptr); },
      "zero segment duration");
  check_throws<invalid_argument>(
      [&clock]() {
        MetricsRecorder bad(numeric_limits<double>::quiet_NaN(), clock, nullptr);
      }, "NaN segment duration");
}

void test_empty_summary()
{
  ManualClock clock;
  MetricsRecorder recorder(2.0, clock, nullptr);

  const auto summary = recorder.summarize();
  check(summary.record_count == 0, "no records");
  check(summary.completed_segments == 0, "no segments");
  check(summary.rebuffer_count == 0, "no rebuffers");
  check_near(summary.mean_throughput_bps, 0, "mean throughput");
  check_near(summary.mean_rtt_s, 0, "mean RTT");
  check_near(summary.mean_buffer_s, 0, "mean buffer");
  check_near(summary.goodput_efficiency, 0, "goodput efficiency");
}

void test_timed_out_segment_summary()
{
  ManualClock clock;
  MetricsRecorder recorder(2.0, clock, nullptr);

  recorder.record(make_obs(0, low, 1000, 0.5, false), low, 0.5);
  recorder.record(make_obs(0, low, 1000, 30, false), low, 30);
  recorder.record(make_obs(1, low, 1000, 1.0, true), low, 1.0);

  const auto summary = recorder.summarize();
  check(summary.timed_out_segments == 1, "segment 0 timed out");
  check(summary.completed_segments == 1, "segment 1 completed");
}

void test_csv_log()
{
  TempDir dir;
  ManualClock clock(5000);

  fs::path metrics_path, summary_path;
  {
    auto sink = make_unique<CsvMetricLog>(dir.path(), "s1");
    metrics_path = sink->metrics_path();
    summary_path = sink->summary_path();

    MetricsRecorder recorder(2.0, clock, move(sink));
    recorder.record(make_obs(0, low, 250000, 1.0, true), low, 0.1);
    recorder.record(make_obs(1, high, 500, 0.5, false), high, 0.1);
    recorder.finish(recorder.summarize());
  }

  check(metrics_path.filename() == "metrics.s1.log", "metric log name");
  check(summary_path.filename() == "summary.s1.txt", "summary name");

  auto lines = read_lines(metrics_path);
  check(lines.size() == 3, "header and two rows");
  check(lines.at(0) == MetricRecord::csv_header(), "header first");
  check(lines.at(1).find(",0,low,") != string::npos, "first row in order");
  check(lines.at(2).find(",1,high,") != string::npos, "second row in order");
  check(lines.at(2).back() == '0', "incomplete row ends with 0");

  /* reopening appends without repeating the header */
  {
    MetricsRecorder recorder(2.0, clock,
                             make_unique<CsvMetricLog>(dir.path(), "s1"));
    recorder.record(make_obs(0, low, 100, 1.0, true), low, 0.1);
  }

  lines = read_lines(metrics_path);
  check(lines.size() == 4, "appended to the existing log");
  check(lines.at(3).back() == '1', "complete row ends with 1");

  const auto summary_lines = read_lines(summary_path);
  check(not summary_lines.empty(), "summary written");
}

void test_log_rotation()
{
  TempDir dir;
  const fs::path path = dir.path() / "rotate.log";

  AppendLog log(path, "h", 10);
  log.append("abcdefghijkl");

  check(fs::exists(path.string() + ".old"), "rotated to .old");

  const auto old_lines = read_lines(path.string() + ".old");
  check(old_lines.size() == 2 and old_lines.at(1) == "abcdefghijkl",
        "old log kept its contents");

  const auto new_lines = read_lines(path);
  check(new_lines.size() == 1 and new_lines.at(0) == "h",
        "new log starts with the header");
}

int main(int argc, char * argv[])
{
  if (argc < 1) {
    abort();
  }

  try {
    test_records();
    test_rejected_observations();
    test_empty_summary();
    test_timed_out_segment_summary();
    test_csv_log();
    test_log_rotation();
  } catch (const exception & e) {
    print_exception(argv[0], e);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
