// Ticket: 0007_record_reflection

#ifndef NBD_TRANSFER_RECORD_FIELDS_HPP
#define NBD_TRANSFER_RECORD_FIELDS_HPP

#include <array>
#include <cstddef>
#include <string_view>

#include <boost/describe.hpp>
#include <boost/mp11.hpp>

namespace nbd_transfer
{

/**
 * @brief Invoke @p fn with (name, value) for every described member of
 * @p record, in declaration order
 *
 * Nested records are passed as-is; callers recurse with forEachField when
 * they need the leaves. Member names come from BOOST_DESCRIBE_STRUCT, so a
 * renamed field changes the emitted name at compile time.
 *
 * @tparam Record A type registered with BOOST_DESCRIBE_STRUCT
 * @tparam Fn Callable as fn(const char*, const Member&)
 */
template <typename Record, typename Fn>
void forEachField(const Record& record, Fn&& fn)
{
  using Members =
    boost::describe::describe_members<Record, boost::describe::mod_public>;
  boost::mp11::mp_for_each<Members>(
    [&](auto descriptor) { fn(descriptor.name, record.*descriptor.pointer); });
}

/**
 * @brief Number of described members of a record type
 */
template <typename Record>
constexpr std::size_t fieldCount()
{
  using Members =
    boost::describe::describe_members<Record, boost::describe::mod_public>;
  return boost::mp11::mp_size<Members>::value;
}

/**
 * @brief Described member names of a record type, in declaration order
 */
template <typename Record>
std::array<std::string_view, fieldCount<Record>()> fieldNames()
{
  using Members =
    boost::describe::describe_members<Record, boost::describe::mod_public>;
  std::array<std::string_view, fieldCount<Record>()> names{};
  std::size_t index = 0;
  boost::mp11::mp_for_each<Members>(
    [&](auto descriptor) { names[index++] = descriptor.name; });
  return names;
}

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_RECORD_FIELDS_HPP
