#pragma once

/// @file core.hpp
/// @brief Main include file for gridhash_core module
///
/// This header includes all gridhash_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Error handling
#include "error.hpp"

// Logging
#include "log.hpp"

/// @namespace gridhash_core
/// @brief Shared infrastructure for the gridhash modules
///
/// - **Error Handling**: Result<T> monadic error handling, SpatialError
///   payloads and process-wide error statistics
/// - **Logging**: spdlog-backed named loggers with level control
///
/// Example usage:
/// @code
/// #include <gridhash/core/core.hpp>
///
/// using namespace gridhash_core;
///
/// Result<int> divide(int a, int b) {
///     if (b == 0) {
///         return Err<int>(std::string("Division by zero"));
///     }
///     return Ok(a / b);
/// }
/// @endcode
