#pragma once

#include <optional>
#include <string>
#include <utility>
#include "core/errors/station_errors.hpp"
#include "protocol/run_execution_contract.hpp"

namespace station::runtime {

class StepContext;

// What a step reports when it returns normally. Raising (throwing) or
// returning an error instead records the step as Errored.
struct StepVerdict {
    bool passed = true;
    std::string detail;

    static StepVerdict pass() { return StepVerdict{}; }
    static StepVerdict fail(std::string detail = "") {
        return StepVerdict{false, std::move(detail)};
    }
};

// Declared by each step type through `static StepMetadata metadata()`.
class StepMetadata {
public:
    explicit StepMetadata(std::string identifier) : identifier_(std::move(identifier)) {}

    StepMetadata& display_name(std::string value) {
        display_name_ = std::move(value);
        return *this;
    }
    StepMetadata& description(std::string value) {
        description_ = std::move(value);
        return *this;
    }
    StepMetadata& image(std::string path) {
        image_ = std::move(path);
        return *this;
    }
    StepMetadata& link(std::string url) {
        link_ = protocol::StepLink{std::move(url), std::nullopt};
        return *this;
    }
    StepMetadata& link(std::string url, std::string text) {
        link_ = protocol::StepLink{std::move(url), std::move(text)};
        return *this;
    }
    StepMetadata& stop_on_fail(bool value) {
        stop_on_fail_ = value;
        return *this;
    }

    // Fills in defaults: display name from the identifier, description from
    // the display name.
    protocol::StepInfo resolve() const;

private:
    std::string identifier_;
    std::optional<std::string> display_name_;
    std::optional<std::string> description_;
    std::optional<std::string> image_;
    std::optional<protocol::StepLink> link_;
    bool stop_on_fail_ = true;
};

class Step {
public:
    virtual ~Step() = default;

    virtual core::errors::Result<StepVerdict> run(StepContext& context) = 0;
};

// "StepWithDisplayName" -> "Step With Display Name", "ReadDUTSerial" ->
// "Read DUT Serial", "power_on" -> "power on".
std::string derive_display_name(const std::string& identifier);

}  // namespace station::runtime
