#pragma once

// C/C++
#include <string>
#include <vector>

// yaml
#include <yaml-cpp/yaml.h>

namespace psychro {

//! one raw (temperature, humidity) pair, not yet validated
struct Sample {
  YAML::Node temperature;
  YAML::Node humidity;
};

//! \brief Read samples from a YAML file
/*!
 * The file holds either a top-level sequence or a "samples" sequence of
 * mappings with "temperature" and "humidity" keys. Entries are kept as
 * given so that each one is validated by its own call.
 */
std::vector<Sample> parse_samples_yaml(std::string const& filename);

std::vector<Sample> parse_samples(YAML::Node const& root);

}  // namespace psychro
