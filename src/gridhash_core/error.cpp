/// @file error.cpp
/// @brief Error handling implementation for gridhash_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <gridhash/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace gridhash_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format spatial error with full context
std::string format_spatial_error(const SpatialError& err) {
    std::ostringstream oss;
    oss << "[SpatialError:" << spatial_error_kind_name(err.kind) << "] " << err.message;

    if (err.kind == SpatialError::Kind::MalformedEntity) {
        oss << " (entity: " << err.entity_index << ")";
    }
    if (err.kind == SpatialError::Kind::CapacityExceeded) {
        oss << " (required: " << err.required << ", capacity: " << err.capacity << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, SpatialError>) {
            oss << detail::format_spatial_error(err);
        }
    }, error.variant());

    const auto& context = error.context();
    if (!context.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : context) {
            if (!first) oss << ", ";
            oss << key << "=\"" << value << "\"";
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::size_t, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> invalid_configuration_errors{0};
    std::atomic<std::uint64_t> capacity_errors{0};
    std::atomic<std::uint64_t> malformed_entity_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (const auto* spatial = error.as<SpatialError>()) {
        switch (spatial->kind) {
            case SpatialError::Kind::InvalidConfiguration:
                s_error_stats.invalid_configuration_errors.fetch_add(1, std::memory_order_relaxed);
                break;
            case SpatialError::Kind::CapacityExceeded:
                s_error_stats.capacity_errors.fetch_add(1, std::memory_order_relaxed);
                break;
            case SpatialError::Kind::MalformedEntity:
                s_error_stats.malformed_entity_errors.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t spatial_error_count(SpatialError::Kind kind) {
    switch (kind) {
        case SpatialError::Kind::InvalidConfiguration:
            return s_error_stats.invalid_configuration_errors.load(std::memory_order_relaxed);
        case SpatialError::Kind::CapacityExceeded:
            return s_error_stats.capacity_errors.load(std::memory_order_relaxed);
        case SpatialError::Kind::MalformedEntity:
            return s_error_stats.malformed_entity_errors.load(std::memory_order_relaxed);
    }
    return 0;
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.invalid_configuration_errors.store(0, std::memory_order_relaxed);
    s_error_stats.capacity_errors.store(0, std::memory_order_relaxed);
    s_error_stats.malformed_entity_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  InvalidConfiguration: " << s_error_stats.invalid_configuration_errors.load() << "\n"
        << "  CapacityExceeded: " << s_error_stats.capacity_errors.load() << "\n"
        << "  MalformedEntity: " << s_error_stats.malformed_entity_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace gridhash_core
