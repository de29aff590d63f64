#pragma once

#include "ports/output/ITokenGenerator.hpp"
#include "settings/SecuritySettings.hpp"

#include <openssl/rand.h>
#include <memory>
#include <string>
#include <vector>

namespace session::adapters::secondary {

/**
 * @brief Генератор токенов на OpenSSL RAND_bytes
 *
 * Берёт tokenLength байт из CSPRNG и кодирует их в URL-safe base64
 * без паддинга (64 байта -> 86 символов).
 */
class OpenSslTokenGenerator : public ports::output::ITokenGenerator {
public:
    explicit OpenSslTokenGenerator(std::shared_ptr<settings::SecuritySettings> settings)
        : tokenLength_(static_cast<std::size_t>(settings->getTokenLength()))
    {}

    std::string generate() override {
        std::vector<unsigned char> bytes(tokenLength_);
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            return "";
        }
        return base64UrlEncode(bytes);
    }

    std::size_t tokenLength() const { return tokenLength_; }

private:
    std::size_t tokenLength_;

    static std::string base64UrlEncode(const std::vector<unsigned char>& input) {
        static const char* chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
        std::string result;
        result.reserve((input.size() * 4 + 2) / 3);
        unsigned int val = 0;
        int valb = -6;
        for (unsigned char c : input) {
            val = ((val << 8) + c) & 0xFFFFFF;
            valb += 8;
            while (valb >= 0) {
                result.push_back(chars[(val >> valb) & 0x3F]);
                valb -= 6;
            }
        }
        if (valb > -6) {
            result.push_back(chars[((val << 8) >> (valb + 8)) & 0x3F]);
        }
        return result;
    }
};

} // namespace session::adapters::secondary
