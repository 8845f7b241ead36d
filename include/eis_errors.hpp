#ifndef EIS_ERRORS_HPP
#define EIS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace eis_sim {

/**
 * @brief Malformed frequency or element range (non-positive bound, inverted min/max, bad count).
 */
class InvalidRangeError : public std::invalid_argument {
  public:
    explicit InvalidRangeError(const std::string &what)
      : std::invalid_argument(what) {}
};

/**
 * @brief An element impedance function was called outside its analytic domain.
 *
 * Raised for non-positive angular frequency or CPE coefficient. Always indicates a
 * bug upstream (sampling or validation), never a recoverable runtime condition.
 */
class DomainError : public std::domain_error {
  public:
    explicit DomainError(const std::string &what)
      : std::domain_error(what) {}
};

/**
 * @brief Unknown equivalent-circuit identifier.
 */
class UnsupportedCircuitError : public std::invalid_argument {
  public:
    explicit UnsupportedCircuitError(int circuit_id)
      : std::invalid_argument("Unsupported circuit id: " + std::to_string(circuit_id) + " (expected 1..5)")
      , circuit_id_(circuit_id) {}

    int circuit_id() const { return circuit_id_; }

  private:
    int circuit_id_;
};

/**
 * @brief Empty, ragged or mismatched tensor/matrix handed to an encoder or preprocessor.
 */
class ShapeError : public std::length_error {
  public:
    explicit ShapeError(const std::string &what)
      : std::length_error(what) {}
};

} // namespace eis_sim

#endif // EIS_ERRORS_HPP
