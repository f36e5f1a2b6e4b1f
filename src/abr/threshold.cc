#include "threshold.hh"

#include <stdexcept>

using namespace std;

Threshold::Threshold(const string & abr_name, const YAML::Node & abr_config)
  : ABRAlgo(abr_name)
{
  if (abr_config["safety_factor"]) {
    safety_factor_ = abr_config["safety_factor"].as<double>();
  }

  if (safety_factor_ <= 0) {
    throw invalid_argument("Threshold: safety_factor must be positive");
  }
}

size_t Threshold::select_representation(const RepresentationLadder & ladder,
                                        const size_t,
                                        const ThroughputEstimate & tput) const
{
  const auto affordable = ladder.highest_below(tput.smoothed_bps * safety_factor_);
  if (affordable) {
    return *affordable;
  }

  return 0;
}
