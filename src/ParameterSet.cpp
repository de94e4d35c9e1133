#include "ParameterSet.hpp"
#include "HazardErrors.hpp"
#include <iomanip>
#include <sstream>

namespace HAZCON {

// =============================================================================
// ParameterSet Implementation
// =============================================================================

ParameterSet::ParameterSet(const ParameterList& entries) {
    for (const auto& entry : entries) {
        if (index_.count(entry.first)) {
            throw ValidationError("model parameter is not unique: " + entry.first);
        }
        index_[entry.first] = entries_.size();
        entries_.push_back(entry);
    }
}

void ParameterSet::set(const std::string& name, ParameterValue value) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        entries_[it->second].second = value;
        return;
    }
    index_[name] = entries_.size();
    entries_.emplace_back(name, value);
}

bool ParameterSet::contains(const std::string& name) const {
    return index_.find(name) != index_.end();
}

ParameterValue ParameterSet::get(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second].second;
}

bool ParameterSet::isAbsent(const std::string& name) const {
    auto it = index_.find(name);
    return it != index_.end() && !entries_[it->second].second.has_value();
}

std::vector<std::string> ParameterSet::absentNames() const {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        if (!entry.second) result.push_back(entry.first);
    }
    return result;
}

std::vector<std::string> ParameterSet::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

// =============================================================================
// ResultLog Implementation
// =============================================================================

void ResultLog::record(const std::string& label, double value) {
    auto it = index_.find(label);
    if (it != index_.end()) {
        entries_[it->second].second = value;
        return;
    }
    index_[label] = entries_.size();
    entries_.emplace_back(label, value);
}

bool ResultLog::contains(const std::string& label) const {
    return index_.find(label) != index_.end();
}

std::optional<double> ResultLog::find(const std::string& label) const {
    auto it = index_.find(label);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second].second;
}

std::string formatLabelValue(double value) {
    std::ostringstream ss;
    ss << std::setprecision(10) << value;
    return ss.str();
}

} // namespace HAZCON
