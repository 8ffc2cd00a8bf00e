#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace storage {

/**
 * Metadata for a saved graph
 */
struct GraphMetadata {
    std::string slug;                    // Unique identifier (URL-friendly)
    std::string name;                    // Display name
    std::string createdAt;               // ISO 8601 timestamp
    std::string updatedAt;               // ISO 8601 timestamp
};

/**
 * A specific version of a graph
 */
struct GraphVersion {
    int64_t id;                          // Auto-incremented version ID
    std::string graphSlug;               // Reference to parent graph
    std::optional<std::string> versionName;  // Optional name (e.g., "v1.0", "before refactor")
    std::string graphJson;               // Serialized GraphDocument
    std::string createdAt;               // ISO 8601 timestamp
};

} // namespace storage
