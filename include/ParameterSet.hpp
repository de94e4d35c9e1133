#ifndef PARAMETER_SET_HPP
#define PARAMETER_SET_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace HAZCON {

/// A parameter value, or std::nullopt when the caller did not provide one
using ParameterValue = std::optional<double>;

/// Raw key/value input as supplied by a caller; may contain duplicates
using ParameterList = std::vector<std::pair<std::string, ParameterValue>>;

/**
 * @brief Insertion-ordered mapping from parameter name to an optional value
 *
 * Holds the material or environment parameters of one model. Names are
 * unique; construction from a ParameterList rejects duplicates.
 */
class ParameterSet {
public:
    ParameterSet() = default;

    /**
     * @brief Build from a raw list
     * @throws ValidationError if a name occurs twice
     */
    explicit ParameterSet(const ParameterList& entries);

    /**
     * @brief Insert or overwrite a value, keeping the original position
     */
    void set(const std::string& name, ParameterValue value);

    bool contains(const std::string& name) const;

    /**
     * @brief Value of a parameter; std::nullopt if absent or not supplied
     */
    ParameterValue get(const std::string& name) const;

    /**
     * @brief True if the parameter was supplied without a value
     */
    bool isAbsent(const std::string& name) const;

    /// Names whose value is absent, in insertion order
    std::vector<std::string> absentNames() const;

    std::vector<std::string> names() const;

    const ParameterList& entries() const { return entries_; }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    ParameterList entries_;
    std::map<std::string, std::size_t> index_;
};

/**
 * @brief Insertion-ordered, append-only-by-key result log
 *
 * Records every value a calculation produced, labelled by what produced it.
 * Recording an existing label overwrites its value in place.
 */
class ResultLog {
public:
    void record(const std::string& label, double value);

    bool contains(const std::string& label) const;

    std::optional<double> find(const std::string& label) const;

    const std::vector<std::pair<std::string, double>>& entries() const { return entries_; }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<std::pair<std::string, double>> entries_;
    std::map<std::string, std::size_t> index_;
};

/**
 * @brief Format a number for a result label ("radius at 0.1 MPa")
 *
 * Uses the shortest representation that round-trips at 10 significant
 * digits, so 0.1 prints as "0.1" and 100 as "100".
 */
std::string formatLabelValue(double value);

} // namespace HAZCON

#endif // PARAMETER_SET_HPP
