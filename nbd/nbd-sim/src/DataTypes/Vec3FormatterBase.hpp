// Ticket: 0003_trajectory_integrator

#ifndef NBD_SIM_VEC3_FORMATTER_BASE_HPP
#define NBD_SIM_VEC3_FORMATTER_BASE_HPP

#include <spdlog/fmt/fmt.h>

namespace nbd_sim::detail
{

/**
 * @brief fmt formatter base for 3-component vector types
 *
 * The format spec applies to every component, using fmt's own floating-point
 * spec grammar ("{:.3f}", "{:8.2e}", ...). Output is "(x, y, z)", so
 * positions and displacements can be passed straight to spdlog.
 */
template <typename T>
struct Vec3FormatterBase
{
  fmt::formatter<double> component;

  constexpr auto parse(fmt::format_parse_context& ctx)
  {
    return component.parse(ctx);
  }

  template <typename FormatContext>
  auto format(const T& vec, FormatContext& ctx) const
  {
    auto out = fmt::format_to(ctx.out(), "(");
    ctx.advance_to(out);
    out = component.format(vec.x(), ctx);
    out = fmt::format_to(out, ", ");
    ctx.advance_to(out);
    out = component.format(vec.y(), ctx);
    out = fmt::format_to(out, ", ");
    ctx.advance_to(out);
    out = component.format(vec.z(), ctx);
    return fmt::format_to(out, ")");
  }
};

}  // namespace nbd_sim::detail

#endif  // NBD_SIM_VEC3_FORMATTER_BASE_HPP
