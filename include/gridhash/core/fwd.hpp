#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for gridhash_core module

#include <cstdint>

namespace gridhash_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct SpatialError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace gridhash_core
