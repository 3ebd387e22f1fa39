#include "session/secret_store.hpp"

#include <cstdlib>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace station::session {

using core::errors::ErrorCategory;
using core::errors::StationError;
using nlohmann::json;

StationError secret_not_found(const std::string& name) {
    return StationError{ErrorCategory::Secret,
                        "Secret is not declared for this run: " + name,
                        "secret_not_found",
                        "Pass --secret " + name + "=<value> during development."};
}

OverrideSecretStore::OverrideSecretStore(std::map<std::string, std::string> values)
    : values_(std::move(values)) {}

core::errors::Result<std::string> OverrideSecretStore::get(
    const std::string& name) const {
    auto found = values_.find(name);
    if (found == values_.end()) {
        return secret_not_found(name);
    }
    return found->second;
}

EnvironmentSecretStore::EnvironmentSecretStore(std::string prefix)
    : prefix_(std::move(prefix)) {}

core::errors::Result<std::string> EnvironmentSecretStore::get(
    const std::string& name) const {
    if (name.empty()) {
        return secret_not_found(name);
    }
    const std::string variable = prefix_ + name;
    const char* value = std::getenv(variable.c_str());
    if (value == nullptr) {
        return secret_not_found(name);
    }
    return std::string(value);
}

JsonFileSecretStore::JsonFileSecretStore(std::filesystem::path path)
    : path_(std::move(path)) {}

core::errors::Result<bool> JsonFileSecretStore::ensure_loaded() const {
    if (values_.has_value()) {
        return true;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        return StationError{ErrorCategory::Infrastructure,
                            "Unable to open secrets file: " + path_.string(),
                            "secret_store_unavailable"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return StationError{ErrorCategory::Infrastructure,
                            "Secrets file is not a JSON object: " + path_.string(),
                            "secret_store_unavailable"};
    }

    std::map<std::string, std::string> loaded;
    for (auto it = document.begin(); it != document.end(); ++it) {
        if (!it.value().is_string()) {
            return StationError{ErrorCategory::Infrastructure,
                                "Secret value must be a string: " + it.key(),
                                "secret_store_unavailable"};
        }
        loaded.emplace(it.key(), it.value().get<std::string>());
    }
    values_ = std::move(loaded);
    return true;
}

core::errors::Result<std::string> JsonFileSecretStore::get(
    const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = ensure_loaded();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }

    auto found = values_->find(name);
    if (found == values_->end()) {
        return secret_not_found(name);
    }
    return found->second;
}

ChainedSecretStore::ChainedSecretStore(
    std::vector<std::shared_ptr<const SecretStore>> stores)
    : stores_(std::move(stores)) {}

core::errors::Result<std::string> ChainedSecretStore::get(
    const std::string& name) const {
    for (const auto& store : stores_) {
        if (!store) {
            continue;
        }
        auto result = store->get(name);
        if (!core::errors::is_error(result)) {
            return result;
        }
        if (core::errors::get_error(result).code != "secret_not_found") {
            return result;
        }
    }
    return secret_not_found(name);
}

}  // namespace station::session
