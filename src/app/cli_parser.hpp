#pragma once
#include "core/config/station_config.hpp"
#include "core/errors/station_errors.hpp"

namespace station::app::cli {
    station::core::errors::Result<station::core::config::StationConfig> parse_and_validate(int argc, char* argv[]);
}
