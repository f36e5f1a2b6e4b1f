#include <cstdlib>

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <atomic>

#include "exception.hh"
#include "filesystem.hh"
#include "util.hh"
#include "clock.hh"
#include "yaml.hh"
#include "metric_log.hh"
#include "session_controller.hh"
#include "http_adapter.hh"
#include "mux_stream_adapter.hh"
#include "stream_trace.hh"
#include "trace_event.hh"

using namespace std;

void print_usage(const string & program_name)
{
  cerr <<
  "Usage: " << program_name << " <YAML configuration> <trace file>...\n\n"
  "Each trace line is \"<time_ms> data <bytes> [end]\" or \"<time_ms> tick\".\n"
  "With the http transport every data line is a complete response."
  << endl;
}

/* replay one trace file as an independent session */
void run_session(const YAML::Node & config, const fs::path & trace_path)
{
  const string session_name = trace_path.stem().string();
  const string transport = config["transport"].as<string>();

  if (transport != "http" and transport != "stream") {
    throw runtime_error("transport must be \"http\" or \"stream\": " + transport);
  }

  ifstream trace_file(trace_path);
  if (not trace_file) {
    throw runtime_error("cannot open trace " + trace_path.string());
  }

  /* simulated time follows the trace */
  ManualClock clock;

  unique_ptr<MetricSink> sink;
  fs::path log_dir;
  const bool enable_logging = config["enable_logging"] and
                              config["enable_logging"].as<bool>();
  if (enable_logging) {
    log_dir = expand_user(config["log_dir"].as<string>());
    fs::create_directories(log_dir);
    sink = make_unique<CsvMetricLog>(log_dir, session_name);
  }

  SessionController session(session_name, load_session_config(config),
                            load_ladder(config), load_abr_algo(config),
                            clock, move(sink));

  StreamTrace trace(clock, "abr-replay");

  unique_ptr<TransportAdapter> adapter;
  HttpSegmentAdapter * http = nullptr;
  MuxStreamAdapter * mux = nullptr;

  if (transport == "http") {
    auto http_adapter = make_unique<HttpSegmentAdapter>(session, clock);
    http = http_adapter.get();
    adapter = move(http_adapter);
  } else {
    YAML::Node rtt_config;
    if (config["rtt"]) {
      rtt_config = config["rtt"];
    }

    trace.log_connection_start(session_name);
    auto mux_adapter = make_unique<MuxStreamAdapter>(
        session, clock, payload_size_rtt(rtt_config), trace);
    mux = mux_adapter.get();
    adapter = move(mux_adapter);
  }

  cerr << session_name << ": " << transport << " transport, "
       << session.abr_algo().abr_name() << " ABR, "
       << session.config().segment_count << " segments" << endl;

  auto request = adapter->request_next();
  if (request) {
    cerr << session_name << ": requesting " << TransportAdapter::resource_name(*request)
         << endl;
  }

  auto after_decision = [&](const optional<Decision> & decision) {
    if (not decision) {
      return;
    }

    cerr << session_name << ": segment " << decision->segment_index
         << (decision->outcome == SegmentOutcome::TimedOut ?
             " timed out" : " completed")
         << ", next " << decision->next << endl;

    request = adapter->request_next();
    if (request) {
      cerr << session_name << ": requesting "
           << TransportAdapter::resource_name(*request) << endl;
    }
  };

  string line;

  while (request and getline(trace_file, line)) {
    const auto event = parse_trace_line(line);
    if (not event) {
      continue;
    }

    clock.set_ms(event->time_ms);

    /* the deadline may have passed before this event arrived */
    after_decision(adapter->poll());
    if (not request or not event->is_data) {
      continue;
    }

    if (http) {
      after_decision(http->on_response(event->bytes));
    } else {
      after_decision(mux->on_stream_data(mux->current_stream_id().value(),
                                         event->bytes, event->end));
    }
  }

  const SessionSummary summary = adapter->finish();
  cerr << session_name << ":\n" << summary.to_string();

  if (enable_logging and mux) {
    trace.save(log_dir / ("trace." + session_name + ".qlog"));
  }
}

int main(int argc, char * argv[])
{
  if (argc < 1) {
    abort();
  }

  if (argc < 3) {
    print_usage(argv[0]);
    return EXIT_FAILURE;
  }

  YAML::Node config;
  try {
    config = YAML::LoadFile(argv[1]);
  } catch (const exception & e) {
    print_exception(argv[0], e);
    return EXIT_FAILURE;
  }

  /* sessions share no mutable state; each gets its own copy of the config */
  atomic<bool> failed {false};
  vector<thread> sessions;

  for (int i = 2; i < argc; i++) {
    const fs::path trace_path = argv[i];

    sessions.emplace_back(
      [session_config = YAML::Clone(config), &failed, trace_path,
       program_name = argv[0]]() {
        try {
          run_session(session_config, trace_path);
        } catch (const exception & e) {
          print_exception(program_name, e);
          failed = true;
        }
      }
    );
  }

  for (auto & session : sessions) {
    session.join();
  }

  return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
