#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace pricemesh
{

    namespace utils
    {

        // Time utilities
        inline std::string getCurrentTimestamp()
        {
            auto now = std::chrono::system_clock::now();
            auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
            auto now_s = std::chrono::duration_cast<std::chrono::seconds>(now_ms);
            auto ms = now_ms - std::chrono::duration_cast<std::chrono::milliseconds>(now_s);

            time_t tt = std::chrono::system_clock::to_time_t(now);
            std::tm local_tm{};
            localtime_r(&tt, &local_tm);

            std::stringstream ss;
            ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
            ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
            return ss.str();
        }

        inline double millisSince(std::chrono::steady_clock::time_point start)
        {
            return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        }

        // Cryptographic utilities
        inline std::array<std::uint8_t, SHA256_DIGEST_LENGTH> hmacSHA256(const std::string &key,
                                                                         const std::uint8_t *data,
                                                                         std::size_t size)
        {
            std::array<std::uint8_t, SHA256_DIGEST_LENGTH> digest{};
            unsigned int length = 0;
            unsigned char *result = HMAC(EVP_sha256(),
                                         key.data(), static_cast<int>(key.size()),
                                         data, size,
                                         digest.data(), &length);
            if (!result || length != digest.size())
            {
                throw std::runtime_error("HMAC-SHA256 computation failed");
            }
            return digest;
        }

        template <typename Container>
        inline std::string toHex(const Container &bytes)
        {
            std::stringstream ss;
            for (auto byte : bytes)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
            }
            return ss.str();
        }

        // String utilities
        inline std::string toLower(std::string str)
        {
            std::transform(str.begin(), str.end(), str.begin(), ::tolower);
            return str;
        }

    } // namespace utils

} // namespace pricemesh
