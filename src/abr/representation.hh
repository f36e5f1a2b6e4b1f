#ifndef REPRESENTATION_HH
#define REPRESENTATION_HH

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <iostream>

struct Representation
{
  std::string id {};
  uint64_t bitrate_bps {};  /* nominal bitrate */

  std::string to_string() const;

  bool operator==(const Representation & o) const;
  bool operator!=(const Representation & o) const;
};

std::ostream &operator<<(std::ostream & os, const Representation & o);

/* immutable list of representations sorted ascending by nominal bitrate;
 * one-step moves are index arithmetic on this order */
class RepresentationLadder
{
public:
  RepresentationLadder(std::vector<Representation> representations);

  size_t size() const { return representations_.size(); }
  const Representation & at(const size_t index) const;

  const Representation & lowest() const { return representations_.front(); }
  const Representation & highest() const { return representations_.back(); }

  /* throws std::invalid_argument for an unknown id */
  size_t index_of(const std::string & id) const;
  bool contains(const std::string & id) const;

  /* highest rung whose bitrate is strictly below bps */
  std::optional<size_t> highest_below(const double bps) const;

  std::optional<size_t> step_up(const size_t index) const;
  std::optional<size_t> step_down(const size_t index) const;

  const std::vector<Representation> & representations() const
  { return representations_; }

private:
  std::vector<Representation> representations_;
};

#endif /* REPRESENTATION_HH */
