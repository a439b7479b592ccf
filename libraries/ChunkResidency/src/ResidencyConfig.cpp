#include "ResidencyConfig.h"
#include "ChunkStorageTypes.h"
#include "Logger.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>

namespace Cellvox::Residency {

namespace {

nlohmann::json ToJsonObject(const ResidencyConfig& config) {
    nlohmann::json j;
    j["storage"]["chunk_edge"] = config.chunkEdge;
    j["storage"]["chunks_per_group"] = config.chunksPerGroup;
    j["storage"]["max_groups"] = config.maxGroups;
    j["storage"]["atlas_extent"] = config.atlasExtent;
    j["logging"]["enabled"] = config.loggingEnabled;
    j["logging"]["terminal"] = config.loggingTerminal;
    j["logging"]["level"] = config.loggingLevel;
    return j;
}

} // anonymous namespace

std::vector<std::string> ResidencyConfig::Validate() const {
    std::vector<std::string> errors;

    if (chunkEdge == 0) {
        errors.push_back("chunk_edge must be positive");
    }
    if (chunksPerGroup == 0 || (chunksPerGroup & (chunksPerGroup - 1)) != 0) {
        errors.push_back("chunks_per_group must be a power of two: " + std::to_string(chunksPerGroup));
    }

    // Texel coordinates and payload sizes are 32-bit on every device
    const uint64_t texelLimit = std::numeric_limits<uint32_t>::max();
    const uint64_t edge = chunkEdge;
    if (edge * chunksPerGroup > texelLimit) {
        errors.push_back("chunk_edge * chunks_per_group exceeds the 32-bit texel range: " +
                         std::to_string(edge * chunksPerGroup));
    }
    if (edge * 2 > texelLimit) {
        errors.push_back("2 * chunk_edge exceeds the 32-bit texel range: " + std::to_string(edge * 2));
    }
    if (edge > 0xFFFF || edge * edge * edge > texelLimit) {
        errors.push_back("chunk_edge cubed exceeds the 32-bit cell count: " + std::to_string(chunkEdge));
    }
    if (maxGroups == 0 || maxGroups > ChunkStorage::MAX_BINDING_ARITY) {
        errors.push_back("max_groups must be 1-" + std::to_string(ChunkStorage::MAX_BINDING_ARITY) +
                         ": " + std::to_string(maxGroups));
    }
    if (atlasExtent == 0 || atlasExtent % 2 != 0) {
        errors.push_back("atlas_extent must be a positive even number: " + std::to_string(atlasExtent));
    }
    if (!Log::ParseLogLevel(loggingLevel)) {
        errors.push_back("Unknown logging level: " + loggingLevel);
    }

    return errors;
}

std::optional<ResidencyConfig> ResidencyConfigLoader::LoadFromFile(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;
        return ParseConfigObject(&j);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<ResidencyConfig> ResidencyConfigLoader::ParseFromString(const std::string& jsonString) {
    try {
        nlohmann::json j = nlohmann::json::parse(jsonString);
        return ParseConfigObject(&j);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool ResidencyConfigLoader::SaveToFile(const ResidencyConfig& config, const std::filesystem::path& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    file << ToJsonObject(config).dump(2);
    return true;
}

std::string ResidencyConfigLoader::SerializeToString(const ResidencyConfig& config) {
    return ToJsonObject(config).dump(2);
}

ResidencyConfig ResidencyConfigLoader::ParseConfigObject(const void* jsonObject) {
    const nlohmann::json& j = *static_cast<const nlohmann::json*>(jsonObject);
    ResidencyConfig config;

    // Type mismatches throw nlohmann::json::type_error, caught by the callers
    if (j.contains("storage")) {
        const auto& storage = j["storage"];
        if (storage.contains("chunk_edge")) config.chunkEdge = storage["chunk_edge"].get<uint32_t>();
        if (storage.contains("chunks_per_group")) config.chunksPerGroup = storage["chunks_per_group"].get<uint32_t>();
        if (storage.contains("max_groups")) config.maxGroups = storage["max_groups"].get<uint32_t>();
        if (storage.contains("atlas_extent")) config.atlasExtent = storage["atlas_extent"].get<uint32_t>();
    }

    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        if (logging.contains("enabled")) config.loggingEnabled = logging["enabled"].get<bool>();
        if (logging.contains("terminal")) config.loggingTerminal = logging["terminal"].get<bool>();
        if (logging.contains("level")) config.loggingLevel = logging["level"].get<std::string>();
    }

    return config;
}

} // namespace Cellvox::Residency
