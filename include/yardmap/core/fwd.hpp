#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for yardmap_core module

#include <cstdint>

namespace yardmap_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct LocationError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace yardmap_core
