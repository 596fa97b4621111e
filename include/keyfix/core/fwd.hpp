#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for keyfix_core module

#include <cstdint>

namespace keyfix_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct FormatError;
struct BufferBoundsError;
struct UnsupportedComponentTypeError;
struct IoError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace keyfix_core
