#ifndef THRESHOLD_HH
#define THRESHOLD_HH

#include "abr_algo.hh"

/* highest representation affordable under a safety margin of the smoothed
 * throughput; the lowest one if nothing is affordable */
class Threshold : public ABRAlgo
{
public:
  Threshold(const std::string & abr_name, const YAML::Node & abr_config);

  size_t select_representation(const RepresentationLadder & ladder,
                               const size_t curr_index,
                               const ThroughputEstimate & tput) const override;

  double safety_factor() const { return safety_factor_; }

private:
  static constexpr double SAFETY_FACTOR = 0.8;

  double safety_factor_ {SAFETY_FACTOR};
};

#endif /* THRESHOLD_HH */
