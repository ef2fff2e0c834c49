#pragma once

/// @file config.hpp
/// @brief Construction options for GridHash

#include "fwd.hpp"
#include "cell.hpp"

#include <gridhash/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace gridhash_spatial {

/// Largest accepted max_entries; keeps 2 * max_entries + 1 representable
constexpr std::size_t k_max_entries_limit = (static_cast<std::size_t>(-1) - 1) / 2;

/// GridHash construction options.
///
/// spacing and max_entries have no meaningful defaults and must be set.
/// JSON form:
/// @code
/// { "spacing": 32, "max_entries": 4096, "rounding": "floor" }
/// @endcode
struct GridHashConfig {
    double spacing = 0.0;                        ///< World-unit edge length of one cell
    std::size_t max_entries = 0;                 ///< Membership capacity per population
    CellRounding rounding = CellRounding::Floor; ///< World to cell coordinate mapping

    /// Bucket count derived from max_entries
    [[nodiscard]] std::size_t cell_count() const noexcept { return 2 * max_entries; }

    /// Check construction preconditions
    [[nodiscard]] gridhash_core::Result<void> validate() const;

    /// Serialize to JSON
    [[nodiscard]] nlohmann::json to_json() const;

    /// Parse and validate from a JSON object
    [[nodiscard]] static gridhash_core::Result<GridHashConfig> from_json(const nlohmann::json& j);

    /// Parse and validate from JSON text
    [[nodiscard]] static gridhash_core::Result<GridHashConfig> from_json_string(const std::string& json_str);

    /// Load and validate from a JSON file
    [[nodiscard]] static gridhash_core::Result<GridHashConfig> load(const std::filesystem::path& path);
};

} // namespace gridhash_spatial
