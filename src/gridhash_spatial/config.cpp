/// @file config.cpp
/// @brief GridHash configuration parsing and validation

#include <gridhash/spatial/config.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

namespace gridhash_spatial {

using gridhash_core::Error;
using gridhash_core::ErrorCode;
using gridhash_core::Result;
using gridhash_core::SpatialError;

Result<void> GridHashConfig::validate() const {
    if (!std::isfinite(spacing) || spacing <= 0.0) {
        return Error(SpatialError::invalid_configuration(
            "spacing must be a finite value > 0, got " + std::to_string(spacing)));
    }
    if (max_entries == 0) {
        return Error(SpatialError::invalid_configuration("max_entries must be > 0"));
    }
    if (max_entries > k_max_entries_limit) {
        return Error(SpatialError::invalid_configuration(
            "max_entries " + std::to_string(max_entries) + " exceeds limit " +
            std::to_string(k_max_entries_limit)));
    }
    return gridhash_core::Ok();
}

nlohmann::json GridHashConfig::to_json() const {
    return nlohmann::json{
        {"spacing", spacing},
        {"max_entries", max_entries},
        {"rounding", cell_rounding_name(rounding)},
    };
}

Result<GridHashConfig> GridHashConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(ErrorCode::ParseError, "Grid hash config must be a JSON object");
    }

    GridHashConfig config;

    // Required: spacing
    if (!j.contains("spacing") || !j["spacing"].is_number()) {
        return Error(ErrorCode::ParseError, "Grid hash config missing required numeric 'spacing' field");
    }
    config.spacing = j["spacing"].get<double>();

    // Required: max_entries
    if (!j.contains("max_entries") || !j["max_entries"].is_number_integer()) {
        return Error(ErrorCode::ParseError, "Grid hash config missing required integer 'max_entries' field");
    }
    if (j["max_entries"].get<std::int64_t>() <= 0) {
        return Error(SpatialError::invalid_configuration("max_entries must be > 0"));
    }
    config.max_entries = j["max_entries"].get<std::size_t>();

    // Optional: rounding (defaults to floor)
    if (j.contains("rounding")) {
        if (!j["rounding"].is_string()) {
            return Error(ErrorCode::ParseError, "'rounding' must be a string");
        }
        auto name = j["rounding"].get<std::string>();
        auto rounding = parse_cell_rounding(name.c_str());
        if (!rounding) {
            return Error(ErrorCode::ParseError, "Unknown rounding mode: " + name)
                .with_context("expected", "floor|truncate");
        }
        config.rounding = *rounding;
    }

    auto valid = config.validate();
    if (!valid) {
        return valid.error();
    }
    return config;
}

Result<GridHashConfig> GridHashConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ErrorCode::ParseError, "JSON parse error: " + std::string(e.what()));
    }
    return from_json(j);
}

Result<GridHashConfig> GridHashConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorCode::IOError, "Failed to open grid hash config: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        Error err = result.error();
        return err.with_context("path", path.string());
    }
    return result;
}

} // namespace gridhash_spatial
