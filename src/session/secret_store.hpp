#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/station_errors.hpp"

namespace station::session {

// Read-only secret lookup for one run context.
class SecretStore {
public:
    virtual ~SecretStore() = default;

    // Fails with `secret_not_found` when the name is not declared for this run.
    virtual core::errors::Result<std::string> get(const std::string& name) const = 0;
};

// Developer literal table, e.g. `--secret FOO=BAR`.
class OverrideSecretStore : public SecretStore {
public:
    explicit OverrideSecretStore(std::map<std::string, std::string> values = {});

    core::errors::Result<std::string> get(const std::string& name) const override;

private:
    std::map<std::string, std::string> values_;
};

// Production values provisioned into the environment as <prefix><NAME>.
class EnvironmentSecretStore : public SecretStore {
public:
    explicit EnvironmentSecretStore(std::string prefix = "STATION_SECRET_");

    core::errors::Result<std::string> get(const std::string& name) const override;

private:
    std::string prefix_;
};

// Flat JSON object of string values, loaded on first lookup.
class JsonFileSecretStore : public SecretStore {
public:
    explicit JsonFileSecretStore(std::filesystem::path path);

    core::errors::Result<std::string> get(const std::string& name) const override;

private:
    core::errors::Result<bool> ensure_loaded() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    mutable std::optional<std::map<std::string, std::string>> values_;
};

// Consults each store in order. Only `secret_not_found` falls through.
class ChainedSecretStore : public SecretStore {
public:
    explicit ChainedSecretStore(std::vector<std::shared_ptr<const SecretStore>> stores);

    core::errors::Result<std::string> get(const std::string& name) const override;

private:
    std::vector<std::shared_ptr<const SecretStore>> stores_;
};

core::errors::StationError secret_not_found(const std::string& name);

}  // namespace station::session
