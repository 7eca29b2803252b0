/**
 * Ferry - BLAKE2b content digests built on libsodium.
 *
 * Digests are reported in logs and transfer summaries so operators can
 * compare both ends; they never travel on the wire.
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>

#include <sodium.h>

namespace ferry::crypto
{

    void ensure_sodium_init();

    class ContentDigest
    {
    public:
        ContentDigest();

        void update(std::span<const std::uint8_t> data);

        // Hex encoded digest. The digest cannot be updated afterwards.
        std::string finish();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

} // namespace ferry::crypto
