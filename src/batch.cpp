// C/C++
#include <algorithm>

// psychro
#include "batch.hpp"

namespace psychro {

std::vector<BatchOutcome> run_batch(PsychrometricsImpl const& engine,
                                    std::vector<Sample> const& samples) {
  std::vector<BatchOutcome> outcomes;
  outcomes.reserve(samples.size());

  for (auto const& sample : samples) {
    BatchOutcome outcome;
    try {
      outcome.result = engine.compute(sample.temperature, sample.humidity);
    } catch (PsychroError const& err) {
      outcome.error = err;
    }
    outcomes.push_back(outcome);
  }

  return outcomes;
}

int batch_status(std::vector<BatchOutcome> const& outcomes) {
  int status = 0;
  for (auto const& outcome : outcomes) {
    if (outcome.ok()) continue;
    status = std::max(status, is_client_fault(outcome.error->kind()) ? 2 : 3);
  }
  return status;
}

YAML::Node to_yaml(std::vector<BatchOutcome> const& outcomes) {
  YAML::Node node(YAML::NodeType::Sequence);
  for (auto const& outcome : outcomes) {
    node.push_back(outcome.ok() ? to_yaml(*outcome.result)
                                : to_yaml(*outcome.error));
  }
  return node;
}

}  // namespace psychro
