#ifndef ABR_ALGO_HH
#define ABR_ALGO_HH

#include <memory>
#include <string>

#include "representation.hh"
#include "yaml-cpp/yaml.h"

/* throughput signals available to a decision, in bits per second */
struct ThroughputEstimate
{
  double smoothed_bps {};  /* mean over the throughput window */
  double latest_bps {};    /* throughput of the segment just finished */
};

class ABRAlgo
{
public:
  virtual ~ABRAlgo() {}

  /* pure: returns the ladder index of the next representation to request */
  virtual size_t select_representation(const RepresentationLadder & ladder,
                                       const size_t curr_index,
                                       const ThroughputEstimate & tput) const = 0;

  /* accessors */
  std::string abr_name() const { return abr_name_; }

protected:
  ABRAlgo(const std::string & abr_name) : abr_name_(abr_name) {}

  std::string abr_name_;
};

/* instantiate the ABR algorithm named abr_name ("threshold" or "hysteresis") */
std::unique_ptr<ABRAlgo> make_abr_algo(const std::string & abr_name,
                                       const YAML::Node & abr_config);

#endif /* ABR_ALGO_HH */
