/**
 * @file StoredFile.hpp
 * @brief Catalog entry for an artifact held by the storage server.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace audiovault::domain {

struct StoredFile {
    std::string filename;
    std::uintmax_t sizeBytes = 0;
    std::string modified;                    ///< ISO-8601 local time.
    std::optional<nlohmann::json> metadata;  ///< Sidecar contents, when present and readable.

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"filename", filename},
            {"size_bytes", sizeBytes},
            {"modified", modified}
        };
        if (metadata) {
            j["metadata"] = *metadata;
        }
        return j;
    }
};

} // namespace audiovault::domain
