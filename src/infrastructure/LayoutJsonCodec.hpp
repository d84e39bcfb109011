/**
 * @file LayoutJsonCodec.hpp
 * @brief JSON form of layout requests and results used by the command-line front end.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/LayoutTypes.hpp"

namespace regionwalker::infrastructure {

class LayoutJsonCodec {
public:
    /**
     * @brief Parses a request object.
     *
     * Malformed optional fields are logged and ignored. A missing "items"
     * array, an item without "id" or an unknown mode rejects the request.
     */
    static std::optional<domain::LayoutRequest> DecodeRequest(const nlohmann::json& j);

    /** @brief Reads and parses a request file. */
    static std::optional<domain::LayoutRequest> ReadRequestFile(const std::filesystem::path& path);

    /** @brief {"mode", "positions": [...], "cards": [...]}. Pending cards carry their prompt and sources. */
    static nlohmann::json EncodeResult(const domain::LayoutResult& result);

    static std::string PlacementToString(domain::PlacementOutcome outcome);
};

} // namespace regionwalker::infrastructure
