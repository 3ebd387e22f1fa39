#include "runtime/step.hpp"

#include <cctype>

namespace station::runtime {

namespace {

bool is_upper(const char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool is_lower(const char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string derive_display_name(const std::string& identifier) {
    std::string out;
    out.reserve(identifier.size() + 8);
    for (std::size_t i = 0; i < identifier.size(); ++i) {
        const char c = identifier[i];
        if (c == '_' || c == '-') {
            if (!out.empty() && out.back() != ' ') {
                out.push_back(' ');
            }
            continue;
        }
        if (is_upper(c) && !out.empty() && out.back() != ' ') {
            const char prev = identifier[i - 1];
            const bool next_is_lower =
                i + 1 < identifier.size() && is_lower(identifier[i + 1]);
            if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_is_lower)) {
                out.push_back(' ');
            }
        }
        out.push_back(c);
    }
    while (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

protocol::StepInfo StepMetadata::resolve() const {
    protocol::StepInfo info;
    info.identifier = identifier_;
    info.display_name = display_name_.has_value() ? display_name_.value()
                                                  : derive_display_name(identifier_);
    info.description = description_.has_value() ? description_.value() : info.display_name;
    info.image = image_;
    info.link = link_;
    info.stop_on_fail = stop_on_fail_;
    return info;
}

}  // namespace station::runtime
