#ifndef RTT_ESTIMATOR_HH
#define RTT_ESTIMATOR_HH

#include <cstdint>
#include <functional>

#include "yaml-cpp/yaml.h"

/* transport-specific RTT heuristic: (payload bytes, elapsed seconds) -> RTT
 * sample in seconds */
using RttEstimator = std::function<double(const uint64_t, const double)>;

/* the whole download time approximates the RTT */
RttEstimator download_time_rtt();

/* small payloads (< small_payload_bytes) take about one RTT; larger ones
 * are scaled down by large_payload_fraction */
RttEstimator payload_size_rtt(const uint64_t small_payload_bytes = 10000,
                              const double large_payload_fraction = 0.1);

/* payload_size_rtt configured from the "rtt" section */
RttEstimator payload_size_rtt(const YAML::Node & rtt_config);

#endif /* RTT_ESTIMATOR_HH */
