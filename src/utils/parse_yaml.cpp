// C/C++
#include <stdexcept>

// psychro
#include "parse_yaml.hpp"

namespace psychro {

std::vector<Sample> parse_samples_yaml(std::string const& filename) {
  return parse_samples(YAML::LoadFile(filename));
}

std::vector<Sample> parse_samples(YAML::Node const& root) {
  auto list = root.IsMap() ? root["samples"] : root;

  if (!list.IsSequence()) {
    throw std::runtime_error(
        "'samples' is not a sequence in the psychrometric batch input");
  }

  std::vector<Sample> samples;
  for (auto const& node : list) {
    // copy, not assign: a missing key yields an invalid node that cannot be
    // assigned through but reports !IsDefined() and fails that sample alone
    // as InvalidType. A non-mapping entry gets two null nodes.
    if (node.IsMap()) {
      samples.push_back({node["temperature"], node["humidity"]});
    } else {
      samples.push_back({YAML::Node(), YAML::Node()});
    }
  }

  return samples;
}

}  // namespace psychro
