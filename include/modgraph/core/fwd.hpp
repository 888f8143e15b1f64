#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for modgraph_core module

#include <cstdint>

namespace modgraph_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ValidationError;
struct ManifestError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class TraceScope;

// =============================================================================
// Configuration
// =============================================================================

enum class ReportFormat : std::uint8_t;
struct ToolConfig;

} // namespace modgraph_core
