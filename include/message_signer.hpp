#pragma once

#include <cstdint>
#include <string>
#include "gossip_codec.hpp"

namespace pricemesh
{
    // Authentication is always an explicit choice; there is no default.
    class SigningConfig
    {
    public:
        static SigningConfig signedWith(std::string key);
        static SigningConfig explicitlyUnsigned();

        bool isSigned() const { return signed_; }
        const std::string &key() const { return key_; }

    private:
        SigningConfig(bool is_signed, std::string key);

        bool signed_;
        std::string key_;
    };

    // HMAC-SHA256 over the whole gossip payload.
    class MessageSigner
    {
    public:
        // Throws std::invalid_argument for a signed config without key material,
        // or for an unsigned config in production mode.
        MessageSigner(SigningConfig config, bool production_mode);

        Signature sign(const std::uint8_t *payload, std::size_t size) const;
        Signature sign(const Bytes &payload) const { return sign(payload.data(), payload.size()); }

        // Constant-time check. In unsigned mode every signature is accepted.
        bool verify(const std::uint8_t *payload, std::size_t size, const Signature &signature) const;

        // As verify, but throws AuthError on a mismatch.
        void require(const std::uint8_t *payload, std::size_t size, const Signature &signature) const;

        bool isSigned() const { return config_.isSigned(); }

    private:
        SigningConfig config_;
    };

} // namespace pricemesh
