#pragma once

// C/C++
#include <sstream>

// fmt
#include <fmt/format.h>

// psychro
#include "errors.hpp"
#include "psychro_options.hpp"
#include "result.hpp"

template <>
struct fmt::formatter<psychro::ErrorKind> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const psychro::ErrorKind& p, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", psychro::to_string(p));
  }
};

template <>
struct fmt::formatter<psychro::Property> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const psychro::Property& p, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{} = {} {}", p.name, p.value, p.unit);
  }
};

template <>
struct fmt::formatter<psychro::PsychroResult> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const psychro::PsychroResult& p, FormatContext& ctx) const {
    std::ostringstream props;
    for (size_t i = 0; i < p.properties.size(); ++i) {
      props << fmt::format("{}", p.properties[i]);
      if (i != p.properties.size() - 1) {
        props << "; ";
      }
    }

    return fmt::format_to(ctx.out(), "(T = {} C; RH = {} %; {})",
                          p.temperature, p.humidity, props.str());
  }
};

template <>
struct fmt::formatter<psychro::PsychroOptions> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const psychro::PsychroOptions& p, FormatContext& ctx) const {
    std::ostringstream props;
    auto names = p.properties();
    for (size_t i = 0; i < names.size(); ++i) {
      props << names[i];
      if (i != names.size() - 1) {
        props << ", ";
      }
    }

    return fmt::format_to(
        ctx.out(),
        "(P = {:.2f}; method = {}; T = [{}, {}]; RH = [{}, {}]; decimals = {}; "
        "properties = ({}); max_iter = {}; ftol = {})",
        p.pressure(), p.method(), p.Tmin(), p.Tmax(), p.RHmin(), p.RHmax(),
        p.decimals(), props.str(), p.max_iter(), p.ftol());
  }
};
