// Ticket: 0001_efficiency_model

#ifndef NBD_SIM_INVALID_PARAMETER_HPP
#define NBD_SIM_INVALID_PARAMETER_HPP

#include <stdexcept>
#include <string>

namespace nbd_sim
{

/**
 * @brief Thrown when a caller passes an argument outside the domain of an
 * operation (non-positive size, missing configuration, empty path)
 *
 * Raised synchronously at the call boundary; no partial result is produced.
 * Numeric degeneracies inside the models are never reported this way, they
 * fall back to defined values instead.
 */
class InvalidParameter : public std::invalid_argument
{
public:
  explicit InvalidParameter(const std::string& what)
    : std::invalid_argument{what}
  {
  }
};

}  // namespace nbd_sim

#endif  // NBD_SIM_INVALID_PARAMETER_HPP
