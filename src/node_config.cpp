#include "node_config.hpp"
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace pricemesh
{
    namespace
    {
        template <typename T>
        T valueOr(const nlohmann::json &json, const char *field, T fallback)
        {
            if (!json.contains(field))
            {
                return fallback;
            }
            return json.at(field).get<T>();
        }

        SigningConfig parseSigning(const nlohmann::json &signing)
        {
            if (!signing.contains("mode"))
            {
                throw std::invalid_argument("signing.mode is required");
            }

            const std::string mode = utils::toLower(signing.at("mode").get<std::string>());
            if (mode == "unsigned")
            {
                return SigningConfig::explicitlyUnsigned();
            }
            if (mode != "hmac-sha256")
            {
                throw std::invalid_argument("unknown signing.mode: " + mode);
            }

            if (signing.contains("key"))
            {
                return SigningConfig::signedWith(signing.at("key").get<std::string>());
            }
            if (signing.contains("key_env"))
            {
                const std::string variable = signing.at("key_env").get<std::string>();
                const char *key = std::getenv(variable.c_str());
                if (!key)
                {
                    throw std::invalid_argument("signing key variable " + variable + " is not set");
                }
                return SigningConfig::signedWith(key);
            }
            throw std::invalid_argument("hmac-sha256 signing needs signing.key or signing.key_env");
        }
    }

    NodeConfig NodeConfig::fromJson(const nlohmann::json &json)
    {
        NodeConfig config;
        try
        {
            if (!json.is_object())
            {
                throw std::invalid_argument("node config must be a JSON object");
            }
            if (!json.contains("node_id"))
            {
                throw std::invalid_argument("node_id is required");
            }

            config.node_id = json.at("node_id").get<std::string>();
            config.capacity = valueOr<std::uint32_t>(json, "capacity", config.capacity);
            config.production = valueOr<bool>(json, "production", config.production);
            config.log_level = valueOr<std::string>(json, "log_level", config.log_level);
            config.store.max_read_retries =
                valueOr<std::uint32_t>(json, "max_read_retries", config.store.max_read_retries);

            config.coherency.gossip_interval = std::chrono::milliseconds(
                valueOr<std::int64_t>(json, "gossip_interval_ms", config.coherency.gossip_interval.count()));
            config.coherency.max_entries_per_message =
                valueOr<std::size_t>(json, "max_entries_per_message", config.coherency.max_entries_per_message);
            config.coherency.full_sync_interval_rounds =
                valueOr<std::uint64_t>(json, "full_sync_interval_rounds", config.coherency.full_sync_interval_rounds);

            if (json.contains("shared_memory"))
            {
                config.shared_memory_name = valueOr<std::string>(json.at("shared_memory"), "name", "");
            }

            if (json.contains("peers"))
            {
                const auto &peers = json.at("peers");
                config.coherency.suspicion_timeout = std::chrono::milliseconds(
                    valueOr<std::int64_t>(peers, "suspicion_timeout_ms", config.coherency.suspicion_timeout.count()));
                config.coherency.failure_timeout = std::chrono::milliseconds(
                    valueOr<std::int64_t>(peers, "failure_timeout_ms", config.coherency.failure_timeout.count()));
                config.coherency.dead_peer_retention = std::chrono::milliseconds(
                    valueOr<std::int64_t>(peers, "dead_peer_retention_ms", config.coherency.dead_peer_retention.count()));
                // The origin registry holds this node as well as its peers
                const auto max_peers = valueOr<std::uint32_t>(peers, "max_peers", config.store.max_origins - 1);
                if (max_peers == 0 || max_peers == UINT32_MAX)
                {
                    throw std::invalid_argument("peers.max_peers must be between 1 and 4294967294");
                }
                config.store.max_origins = max_peers + 1;
            }

            if (json.contains("signing"))
            {
                config.signing = parseSigning(json.at("signing"));
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("invalid node config: " + std::string(e.what()));
        }

        if (config.node_id.empty())
        {
            throw std::invalid_argument("node_id must not be empty");
        }
        if (config.capacity == 0)
        {
            throw std::invalid_argument("capacity must be positive");
        }
        if (config.coherency.gossip_interval.count() <= 0)
        {
            throw std::invalid_argument("gossip_interval_ms must be positive");
        }
        if (config.coherency.max_entries_per_message == 0)
        {
            throw std::invalid_argument("max_entries_per_message must be positive");
        }
        if (config.store.max_read_retries == 0)
        {
            throw std::invalid_argument("max_read_retries must be positive");
        }
        if (config.coherency.failure_timeout < config.coherency.suspicion_timeout)
        {
            throw std::invalid_argument("peers.failure_timeout_ms must not be below suspicion_timeout_ms");
        }
        return config;
    }

    NodeConfig NodeConfig::fromFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file)
        {
            throw std::invalid_argument("cannot open config file " + path);
        }

        nlohmann::json json;
        try
        {
            file >> json;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::invalid_argument("failed to parse " + path + ": " + e.what());
        }
        return fromJson(json);
    }

    MessageSigner NodeConfig::makeSigner() const
    {
        if (!signing)
        {
            throw std::invalid_argument("signing must be configured explicitly");
        }
        return MessageSigner(*signing, production);
    }

    void configureLogging(const std::string &level)
    {
        const auto parsed = spdlog::level::from_str(utils::toLower(level));
        // from_str maps unknown names to off
        if (parsed == spdlog::level::off && utils::toLower(level) != "off")
        {
            throw std::invalid_argument("unknown log level: " + level);
        }
        spdlog::set_level(parsed);
    }

} // namespace pricemesh
