#include "yaml.hh"

#include <stdexcept>

using namespace std;

RepresentationLadder load_ladder(const YAML::Node & config)
{
  const auto & ladder_node = config["ladder"];
  if (not ladder_node or not ladder_node.IsSequence()) {
    throw runtime_error("YAML config must contain a \"ladder\" list");
  }

  vector<Representation> representations;

  for (const auto & repr_node : ladder_node) {
    representations.push_back({repr_node["id"].as<string>(),
                               repr_node["bitrate"].as<uint64_t>()});
  }

  return RepresentationLadder(move(representations));
}

SessionConfig load_session_config(const YAML::Node & config)
{
  SessionConfig ret;

  if (config["segment_duration_s"]) {
    ret.segment_duration_s = config["segment_duration_s"].as<double>();
  }

  ret.segment_count = config["segment_count"].as<uint64_t>();

  if (config["timeout_s"]) {
    ret.timeout_s = config["timeout_s"].as<double>();
  }

  if (config["throughput_window"]) {
    ret.throughput_window = config["throughput_window"].as<size_t>();
  }

  if (config["rtt_window"]) {
    ret.rtt_window = config["rtt_window"].as<size_t>();
  }

  return ret;
}

unique_ptr<ABRAlgo> load_abr_algo(const YAML::Node & config)
{
  const string abr_name = config["abr_algorithm"].as<string>();

  YAML::Node abr_config;
  if (config["abr_config"]) {
    abr_config = config["abr_config"];
  }

  return make_abr_algo(abr_name, abr_config);
}
