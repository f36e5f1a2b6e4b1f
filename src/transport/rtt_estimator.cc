#include "rtt_estimator.hh"

#include <stdexcept>

using namespace std;

RttEstimator download_time_rtt()
{
  return [](const uint64_t, const double elapsed_s) {
    return elapsed_s;
  };
}

RttEstimator payload_size_rtt(const uint64_t small_payload_bytes,
                              const double large_payload_fraction)
{
  if (large_payload_fraction <= 0 or large_payload_fraction > 1) {
    throw invalid_argument("large_payload_fraction must be in (0, 1]");
  }

  return [small_payload_bytes, large_payload_fraction]
         (const uint64_t bytes, const double elapsed_s) {
    if (bytes < small_payload_bytes) {
      return elapsed_s;
    }

    return elapsed_s * large_payload_fraction;
  };
}

RttEstimator payload_size_rtt(const YAML::Node & rtt_config)
{
  uint64_t small_payload_bytes = 10000;
  double large_payload_fraction = 0.1;

  if (rtt_config["small_payload_bytes"]) {
    small_payload_bytes = rtt_config["small_payload_bytes"].as<uint64_t>();
  }

  if (rtt_config["large_payload_fraction"]) {
    large_payload_fraction = rtt_config["large_payload_fraction"].as<double>();
  }

  return payload_size_rtt(small_payload_bytes, large_payload_fraction);
}
