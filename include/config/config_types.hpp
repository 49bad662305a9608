#pragma once

#include <string>

namespace pgcrud {

// ============================================================================
// Database Config
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;      // libpq conninfo or URI
};

// ============================================================================
// Metadata Config
// ============================================================================

struct MetadataConfig {
    bool use_regtypes = false;          // expose ::regtype names in get_attnames
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// ClientConfig - Complete parsed configuration
// ============================================================================

struct ClientConfig {
    DatabaseConfig database;
    MetadataConfig metadata;
    LoggingConfig logging;
};

} // namespace pgcrud
