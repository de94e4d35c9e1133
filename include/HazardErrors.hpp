#ifndef HAZARD_ERRORS_HPP
#define HAZARD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace HAZCON {

/**
 * @brief Base class of every error raised by the hazard models
 *
 * Catch this at the boundary to turn a failed calculation into a
 * failure response; the models themselves never catch it.
 */
class HazardError : public std::runtime_error {
public:
    explicit HazardError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Missing, duplicate or out-of-domain input
 *
 * Raised at the first use of the offending value.
 */
class ValidationError : public HazardError {
public:
    explicit ValidationError(const std::string& msg) : HazardError(msg) {}
};

/**
 * @brief A derived quantity produced a zero denominator
 */
class ComputationError : public HazardError {
public:
    explicit ComputationError(const std::string& msg) : HazardError(msg) {}
};

/**
 * @brief Standard message for a parameter that is missing or invalid
 */
inline std::string parameterError(const std::string& name) {
    return "parameter \"" + name + "\" loss or error.";
}

} // namespace HAZCON

#endif // HAZARD_ERRORS_HPP
