#pragma once

#include <any>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/station_errors.hpp"

namespace station::session {

// Per-run key/value store shared by reference with every step of one run.
// Not synchronized: the sequencer runs steps strictly one at a time.
class RunState {
public:
    core::errors::Result<std::any> get(const std::string& key) const;

    template <typename T>
    core::errors::Result<T> get_as(const std::string& key) const {
        auto found = values_.find(key);
        if (found == values_.end()) {
            return not_found(key);
        }
        const T* typed = std::any_cast<T>(&found->second);
        if (typed == nullptr) {
            return type_mismatch(key);
        }
        return *typed;
    }

    void set(const std::string& key, std::any value);
    bool contains(const std::string& key) const;
    bool erase(const std::string& key);
    std::size_t size() const;
    std::vector<std::string> keys() const;

private:
    static core::errors::StationError not_found(const std::string& key);
    static core::errors::StationError type_mismatch(const std::string& key);

    std::unordered_map<std::string, std::any> values_;
};

}  // namespace station::session
