#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Cellvox::Residency {

/**
 * @brief Geometry and logging settings for a ChunkResidencyManager
 *
 * JSON schema (every key optional):
 * @code
 * {
 *   "storage": {
 *     "chunk_edge": 64,
 *     "chunks_per_group": 32,
 *     "max_groups": 8,
 *     "atlas_extent": 64
 *   },
 *   "logging": { "enabled": false, "terminal": false, "level": "info" }
 * }
 * @endcode
 */
struct ResidencyConfig {
    uint32_t chunkEdge = 64;
    uint32_t chunksPerGroup = 32;
    uint32_t maxGroups = 8;
    uint32_t atlasExtent = 64;

    bool loggingEnabled = false;
    bool loggingTerminal = false;
    std::string loggingLevel = "info";

    /**
     * @brief Check the configuration
     * @return Vector of error messages (empty if valid)
     */
    std::vector<std::string> Validate() const;

    bool IsValid() const { return Validate().empty(); }
};

class ResidencyConfigLoader {
public:
    /// Load configuration from JSON file
    /// @return Configuration if successful, empty optional on error
    static std::optional<ResidencyConfig> LoadFromFile(const std::filesystem::path& filepath);

    /// Parse configuration from JSON string
    static std::optional<ResidencyConfig> ParseFromString(const std::string& jsonString);

    /// Save configuration to JSON file
    static bool SaveToFile(const ResidencyConfig& config, const std::filesystem::path& filepath);

    /// Serialize configuration to JSON string
    static std::string SerializeToString(const ResidencyConfig& config);

private:
    static ResidencyConfig ParseConfigObject(const void* jsonObject);
};

} // namespace Cellvox::Residency
