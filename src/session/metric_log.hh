#ifndef METRIC_LOG_HH
#define METRIC_LOG_HH

#include <cstdint>
#include <string>

#include "filesystem.hh"
#include "file_descriptor.hh"
#include "metric_record.hh"

/* append-only log file; each line reaches the kernel before append() returns,
 * so a crash loses at most the line being written */
class AppendLog
{
public:
  static constexpr uint64_t MAX_LOG_FILESIZE = 100 * 1024 * 1024;  /* 100 MB */

  /* header is written as the first line of every new (empty) log */
  AppendLog(const fs::path & path, const std::string & header = "",
            const uint64_t max_filesize = MAX_LOG_FILESIZE);

  void append(const std::string & line);

  const fs::path & path() const { return path_; }

private:
  fs::path path_;
  std::string header_;
  uint64_t max_filesize_;
  FileDescriptor fd_;

  FileDescriptor open_log();
};

/* receives every metric record in creation order, then the summary */
class MetricSink
{
public:
  virtual ~MetricSink() {}

  virtual void append(const MetricRecord & record) = 0;
  virtual void finish(const SessionSummary &) {}
};

/* metrics.<session>.log (CSV) and summary.<session>.txt under log_dir */
class CsvMetricLog : public MetricSink
{
public:
  CsvMetricLog(const fs::path & log_dir, const std::string & session_name);

  void append(const MetricRecord & record) override;
  void finish(const SessionSummary & summary) override;

  const fs::path & metrics_path() const { return log_.path(); }
  const fs::path & summary_path() const { return summary_path_; }

private:
  AppendLog log_;
  fs::path summary_path_;
};

#endif /* METRIC_LOG_HH */
