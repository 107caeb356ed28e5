// C/C++
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// fmt
#include <fmt/format.h>

// yaml
#include <yaml-cpp/yaml.h>

// psychro
#include <psychro/batch.hpp>
#include <psychro/psychro.hpp>
#include <psychro/psychro_formatter.hpp>
#include <psychro/utils/parse_yaml.hpp>

using namespace psychro;

namespace {

void usage(char const* prog) {
  std::cerr << "Usage: " << prog
            << " [-c config.yaml] <temperature> <humidity>\n"
            << "       " << prog << " [-c config.yaml] -b samples.yaml\n"
            << "       " << prog << " [-c config.yaml] --info\n"
            << "The configuration defaults to $PSYCHRO_CONFIG." << std::endl;
}

void log_error(PsychroError const& err, std::string const& where = "") {
  if (is_client_fault(err.kind())) {
    fmt::print(stderr, "[psychro] warning: {}{}: {}\n", where, err.kind(),
               err.what());
  } else if (err.kind() == ErrorKind::CalculationError) {
    fmt::print(stderr, "[psychro] error (internal): {}{}: {}\n", where,
               err.kind(), err.what());
  } else {
    fmt::print(stderr, "[psychro] error: {}{}: {}\n", where, err.kind(),
               err.what());
  }
}

int status_of(PsychroError const& err) {
  return is_client_fault(err.kind()) ? 2 : 3;
}

// command-line text as a YAML scalar so that "abc" stays text and "-5"
// becomes a number
YAML::Node parse_arg(std::string const& arg) {
  try {
    return YAML::Load(arg);
  } catch (YAML::ParserException const&) {
    return YAML::Node(arg);
  }
}

void emit(YAML::Node const& node) {
  YAML::Emitter out;
  out << node;
  std::cout << out.c_str() << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_file, batch_file;
  bool show_info = false;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      config_file = argv[++i];
    } else if ((arg == "-b" || arg == "--batch") && i + 1 < argc) {
      batch_file = argv[++i];
    } else if (arg == "--info") {
      show_info = true;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      args.push_back(arg);
    }
  }

  if (config_file.empty() && std::getenv("PSYCHRO_CONFIG") != nullptr) {
    config_file = std::getenv("PSYCHRO_CONFIG");
  }

  bool single = args.size() == 2 && batch_file.empty() && !show_info;
  bool batch = args.empty() && !batch_file.empty() && !show_info;
  if (!single && !batch && !(show_info && args.empty())) {
    usage(argv[0]);
    return 1;
  }

  Psychrometrics engine(nullptr);
  try {
    auto op = config_file.empty() ? PsychroOptions()
                                  : PsychroOptions::from_yaml(config_file);
    engine = Psychrometrics(op);
  } catch (YAML::Exception const& e) {
    fmt::print(stderr, "[psychro] error: cannot read {}: {}\n", config_file,
               e.what());
    return 1;
  } catch (c10::Error const& e) {
    fmt::print(stderr, "[psychro] error: invalid configuration: {}\n",
               e.what_without_backtrace());
    return 1;
  }

  if (show_info) {
    emit(engine->info());
    return 0;
  }

  if (single) {
    try {
      auto result = engine->compute(parse_arg(args[0]), parse_arg(args[1]));
      emit(to_yaml(result));
      return 0;
    } catch (PsychroError const& err) {
      log_error(err);
      emit(to_yaml(err));
      return status_of(err);
    }
  }

  std::vector<Sample> samples;
  try {
    samples = parse_samples_yaml(batch_file);
  } catch (YAML::Exception const& e) {
    fmt::print(stderr, "[psychro] error: cannot read {}: {}\n", batch_file,
               e.what());
    return 1;
  } catch (std::runtime_error const& e) {
    fmt::print(stderr, "[psychro] error: {}: {}\n", batch_file, e.what());
    return 1;
  }

  auto outcomes = run_batch(*engine, samples);
  for (size_t i = 0; i < outcomes.size(); ++i) {
    if (!outcomes[i].ok()) {
      log_error(*outcomes[i].error, fmt::format("sample {}: ", i + 1));
    }
  }

  emit(to_yaml(outcomes));
  return batch_status(outcomes);
}
