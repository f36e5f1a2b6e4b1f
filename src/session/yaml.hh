#ifndef YAML_HH
#define YAML_HH

#include <string>
#include <vector>

#include "yaml-cpp/yaml.h"
#include "representation.hh"
#include "session_controller.hh"

/* get the representation ladder from the "ladder" list */
RepresentationLadder load_ladder(const YAML::Node & config);

/* get session settings; absent keys keep their defaults */
SessionConfig load_session_config(const YAML::Node & config);

/* get the ABR algorithm named by "abr_algorithm" with its "abr_config" */
std::unique_ptr<ABRAlgo> load_abr_algo(const YAML::Node & config);

#endif /* YAML_HH */
