#include "abr_algo.hh"
#include "threshold.hh"
#include "hysteresis.hh"

#include <stdexcept>

using namespace std;

unique_ptr<ABRAlgo> make_abr_algo(const string & abr_name,
                                  const YAML::Node & abr_config)
{
  if (abr_name == "threshold") {
    return make_unique<Threshold>(abr_name, abr_config);
  } else if (abr_name == "hysteresis") {
    return make_unique<Hysteresis>(abr_name, abr_config);
  } else {
    throw runtime_error("ABR algorithm is not supported: " + abr_name);
  }
}
