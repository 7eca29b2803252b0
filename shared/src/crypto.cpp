#include "ferry/crypto.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

namespace ferry::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       { throw_if_sodium_init_failed(sodium_init()); });
    }

    ContentDigest::ContentDigest()
    {
        ensure_sodium_init();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    void ContentDigest::update(std::span<const std::uint8_t> data)
    {
        if (finished_)
        {
            throw std::logic_error("digest already finished");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_generichash_update(&state_, data.data(), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string ContentDigest::finish()
    {
        if (finished_)
        {
            throw std::logic_error("digest already finished");
        }
        finished_ = true;
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return to_hex(digest);
    }

} // namespace ferry::crypto
