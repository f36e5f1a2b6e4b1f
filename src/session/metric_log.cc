#include "metric_log.hh"

#include <fcntl.h>

#include <iostream>
#include <fstream>
#include <stdexcept>

#include "exception.hh"

using namespace std;

AppendLog::AppendLog(const fs::path & path, const string & header,
                     const uint64_t max_filesize)
  : path_(path), header_(header), max_filesize_(max_filesize),
    fd_(open_log())
{}

FileDescriptor AppendLog::open_log()
{
  FileDescriptor fd(CheckSystemCall("open (" + path_.string() + ")",
      open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644)));

  /* O_APPEND leaves the offset at 0 until the first write */
  if (not header_.empty() and fd.seek(0, SEEK_END) == 0) {
    fd.write(header_ + "\n");
  }

  return fd;
}

void AppendLog::append(const string & line)
{
  fd_.write(line + "\n");

  /* rotate log if filesize is too large */
  if (fd_.curr_offset() > max_filesize_) {
    fs::rename(path_, path_.string() + ".old");
    cerr << "Renamed " << path_.string() << " to "
         << path_.string() + ".old" << endl;

    /* create new fd before closing old one */
    FileDescriptor new_fd = open_log();
    fd_.close();

    fd_ = move(new_fd);
  }
}

CsvMetricLog::CsvMetricLog(const fs::path & log_dir, const string & session_name)
  : log_(log_dir / ("metrics." + session_name + ".log"),
         MetricRecord::csv_header()),
    summary_path_(log_dir / ("summary." + session_name + ".txt"))
{}

void CsvMetricLog::append(const MetricRecord & record)
{
  log_.append(record.to_csv());
}

void CsvMetricLog::finish(const SessionSummary & summary)
{
  ofstream summary_file(summary_path_);
  if (not summary_file) {
    throw runtime_error("cannot open " + summary_path_.string());
  }

  summary_file << summary.to_string();

  if (not summary_file.flush()) {
    throw runtime_error("failed to write " + summary_path_.string());
  }
}
