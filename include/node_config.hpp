#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "coherency_manager.hpp"
#include "message_signer.hpp"
#include "seqlock_store.hpp"

namespace pricemesh
{
    // Settings for one pricemesh node. Every parse or validation failure
    // throws std::invalid_argument.
    struct NodeConfig
    {
        std::string node_id;
        std::uint32_t capacity = 1100;
        // Empty means a private anonymous segment
        std::string shared_memory_name;
        bool production = true;
        std::string log_level = "info";
        StoreConfig store;
        CoherencyConfig coherency;
        std::optional<SigningConfig> signing;

        static NodeConfig fromJson(const nlohmann::json &json);
        static NodeConfig fromFile(const std::string &path);

        MessageSigner makeSigner() const;
    };

    // Sets the default spdlog logger level from a name such as "debug" or "warn".
    void configureLogging(const std::string &level);

} // namespace pricemesh
