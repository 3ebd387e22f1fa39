#include "session/run_state.hpp"

#include <algorithm>
#include <utility>

namespace station::session {

using core::errors::ErrorCategory;
using core::errors::StationError;

core::errors::Result<std::any> RunState::get(const std::string& key) const {
    auto found = values_.find(key);
    if (found == values_.end()) {
        return not_found(key);
    }
    return found->second;
}

void RunState::set(const std::string& key, std::any value) {
    values_[key] = std::move(value);
}

bool RunState::contains(const std::string& key) const {
    return values_.find(key) != values_.end();
}

bool RunState::erase(const std::string& key) {
    return values_.erase(key) > 0;
}

std::size_t RunState::size() const {
    return values_.size();
}

std::vector<std::string> RunState::keys() const {
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& entry : values_) {
        out.push_back(entry.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

StationError RunState::not_found(const std::string& key) {
    return StationError{ErrorCategory::Step, "Run state has no key: " + key,
                        "state_key_not_found"};
}

StationError RunState::type_mismatch(const std::string& key) {
    return StationError{ErrorCategory::Step,
                        "Run state value has a different type: " + key,
                        "state_type_mismatch"};
}

}  // namespace station::session
