#include "message_signer.hpp"
#include <stdexcept>
#include <utility>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "utils.hpp"

namespace pricemesh
{

    SigningConfig::SigningConfig(bool is_signed, std::string key)
        : signed_(is_signed), key_(std::move(key))
    {
    }

    SigningConfig SigningConfig::signedWith(std::string key)
    {
        return SigningConfig(true, std::move(key));
    }

    SigningConfig SigningConfig::explicitlyUnsigned()
    {
        return SigningConfig(false, std::string());
    }

    MessageSigner::MessageSigner(SigningConfig config, bool production_mode)
        : config_(std::move(config))
    {
        if (config_.isSigned() && config_.key().empty())
        {
            throw std::invalid_argument("gossip signing requested but no key material was provided");
        }
        if (!config_.isSigned())
        {
            if (production_mode)
            {
                throw std::invalid_argument("unsigned gossip is not allowed in production mode");
            }
            spdlog::warn("Gossip authentication explicitly disabled; messages will not be signed or verified");
        }
    }

    Signature MessageSigner::sign(const std::uint8_t *payload, std::size_t size) const
    {
        Signature signature{};
        if (!config_.isSigned())
        {
            return signature;
        }
        signature = utils::hmacSHA256(config_.key(), payload, size);
        return signature;
    }

    bool MessageSigner::verify(const std::uint8_t *payload, std::size_t size, const Signature &signature) const
    {
        if (!config_.isSigned())
        {
            return true;
        }
        const Signature expected = utils::hmacSHA256(config_.key(), payload, size);
        return CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) == 0;
    }

    void MessageSigner::require(const std::uint8_t *payload, std::size_t size, const Signature &signature) const
    {
        if (!verify(payload, size, signature))
        {
            throw AuthError("HMAC-SHA256 mismatch over " + std::to_string(size) + " payload bytes");
        }
    }

} // namespace pricemesh
