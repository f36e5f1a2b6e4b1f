#include "representation.hh"

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace std;

string Representation::to_string() const
{
  return id + " (" + std::to_string(bitrate_bps) + " bps)";
}

bool Representation::operator==(const Representation & o) const
{
  return id == o.id and bitrate_bps == o.bitrate_bps;
}

bool Representation::operator!=(const Representation & o) const
{
  return not (*this == o);
}

ostream &operator<<(ostream & os, const Representation & o)
{
  os << o.to_string();
  return os;
}

RepresentationLadder::RepresentationLadder(vector<Representation> representations)
  : representations_(move(representations))
{
  if (representations_.empty()) {
    throw invalid_argument("representation ladder cannot be empty");
  }

  set<string> ids;
  for (const auto & repr : representations_) {
    if (repr.id.empty()) {
      throw invalid_argument("representation id cannot be empty");
    }

    if (not ids.emplace(repr.id).second) {
      throw invalid_argument("duplicate representation: " + repr.id);
    }
  }

  /* keep the configured order among equal bitrates */
  stable_sort(representations_.begin(), representations_.end(),
    [](const Representation & a, const Representation & b) {
      return a.bitrate_bps < b.bitrate_bps;
    }
  );
}

const Representation & RepresentationLadder::at(const size_t index) const
{
  if (index >= representations_.size()) {
    throw out_of_range("representation index " + to_string(index)
                       + " out of range");
  }

  return representations_[index];
}

size_t RepresentationLadder::index_of(const string & id) const
{
  for (size_t i = 0; i < representations_.size(); i++) {
    if (representations_[i].id == id) {
      return i;
    }
  }

  throw invalid_argument("unknown representation: " + id);
}

bool RepresentationLadder::contains(const string & id) const
{
  return any_of(representations_.begin(), representations_.end(),
                [&id](const Representation & r) { return r.id == id; });
}

optional<size_t> RepresentationLadder::highest_below(const double bps) const
{
  /* scan from the top so that among equally affordable rungs the later
   * (higher) one wins */
  for (size_t i = representations_.size(); i-- > 0;) {
    if (representations_[i].bitrate_bps < bps) {
      return i;
    }
  }

  return nullopt;
}

optional<size_t> RepresentationLadder::step_up(const size_t index) const
{
  if (index + 1 >= representations_.size()) {
    return nullopt;
  }

  return index + 1;
}

optional<size_t> RepresentationLadder::step_down(const size_t index) const
{
  if (index == 0 or index >= representations_.size()) {
    return nullopt;
  }

  return index - 1;
}
