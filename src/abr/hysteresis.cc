#include "hysteresis.hh"

#include <stdexcept>

using namespace std;

Hysteresis::Hysteresis(const string & abr_name, const YAML::Node & abr_config)
  : ABRAlgo(abr_name)
{
  if (abr_config["up_factor"]) {
    up_factor_ = abr_config["up_factor"].as<double>();
  }

  if (abr_config["down_factor"]) {
    down_factor_ = abr_config["down_factor"].as<double>();
  }

  if (down_factor_ <= 0 or up_factor_ <= down_factor_) {
    throw invalid_argument("Hysteresis: requires 0 < down_factor < up_factor");
  }
}

size_t Hysteresis::select_representation(const RepresentationLadder & ladder,
                                         const size_t curr_index,
                                         const ThroughputEstimate & tput) const
{
  const double curr_bitrate = ladder.at(curr_index).bitrate_bps;

  if (tput.latest_bps > curr_bitrate * up_factor_) {
    if (const auto up = ladder.step_up(curr_index)) {
      return *up;
    }
  } else if (tput.latest_bps < curr_bitrate * down_factor_) {
    if (const auto down = ladder.step_down(curr_index)) {
      return *down;
    }
  }

  /* between the thresholds, or no rung to move to */
  return curr_index;
}
