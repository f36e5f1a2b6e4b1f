#ifndef HYSTERESIS_HH
#define HYSTERESIS_HH

#include "abr_algo.hh"

/* moves at most one rung per decision: up past up_factor times the current
 * bitrate, down below down_factor times it, otherwise holds */
class Hysteresis : public ABRAlgo
{
public:
  Hysteresis(const std::string & abr_name, const YAML::Node & abr_config);

  size_t select_representation(const RepresentationLadder & ladder,
                               const size_t curr_index,
                               const ThroughputEstimate & tput) const override;

private:
  static constexpr double UP_FACTOR = 1.5;
  static constexpr double DOWN_FACTOR = 0.8;

  double up_factor_ {UP_FACTOR};
  double down_factor_ {DOWN_FACTOR};
};

#endif /* HYSTERESIS_HH */
