// Ticket: 0002_single_precision_vector_types

#ifndef TIRE_CORE_VEC3F_FORMATTER_HPP
#define TIRE_CORE_VEC3F_FORMATTER_HPP

#include <fmt/format.h>

#include <concepts>
#include <string>

#include "tire-core/src/DataTypes/Vec3FBase.hpp"

namespace tire_core::detail
{

template <typename T>
concept Vec3FType = std::derived_from<T, Vec3FBase<T>>;

/// Parses an optional [.precision][f|e|g] spec and writes the components
/// of a Vec3FBase-derived type as "(x, y, z)".
struct Vec3FFormatter
{
  char presentation = 'f';
  int precision = 6;

  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    auto it = ctx.begin();
    auto const end = ctx.end();

    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }

    if (it != end && (*it == 'f' || *it == 'e' || *it == 'g'))
    {
      presentation = *it;
      ++it;
    }

    return it;
  }

  template <typename Vec, typename FormatContext>
  auto format(const Vec& vec, FormatContext& ctx) const
  {
    return fmt::format_to(ctx.out(),
                          "({}, {}, {})",
                          component(vec.x()),
                          component(vec.y()),
                          component(vec.z()));
  }

private:
  [[nodiscard]] std::string component(float value) const
  {
    switch (presentation)
    {
      case 'e':
        return fmt::format("{:.{}e}", value, precision);
      case 'g':
        return fmt::format("{:.{}g}", value, precision);
      default:
        return fmt::format("{:.{}f}", value, precision);
    }
  }
};

}  // namespace tire_core::detail

template <tire_core::detail::Vec3FType T>
struct fmt::formatter<T> : tire_core::detail::Vec3FFormatter
{
};

#endif  // TIRE_CORE_VEC3F_FORMATTER_HPP
