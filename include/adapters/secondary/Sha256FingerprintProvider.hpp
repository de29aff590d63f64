#pragma once

#include "ports/output/IFingerprintProvider.hpp"
#include "settings/SecuritySettings.hpp"

#include <openssl/sha.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

namespace session::adapters::secondary {

/**
 * @brief Отпечаток запроса: первые 16 hex-символов SHA-256 от
 * "clientIp|userAgent|acceptLanguage|acceptEncoding"
 */
class Sha256FingerprintProvider : public ports::output::IFingerprintProvider {
public:
    static constexpr std::size_t kFingerprintLength = 16;

    explicit Sha256FingerprintProvider(std::shared_ptr<settings::SecuritySettings> settings)
        : enabled_(settings->isFingerprintingEnabled())
    {}

    std::string compute(const domain::RequestMetadata& metadata) const override {
        if (!enabled_) {
            return "";
        }

        const std::string data = metadata.clientIp + "|" + metadata.userAgent + "|"
                               + metadata.acceptLanguage + "|" + metadata.acceptEncoding;

        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

        std::ostringstream oss;
        for (std::size_t i = 0; i < kFingerprintLength / 2; ++i) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

private:
    bool enabled_;
};

} // namespace session::adapters::secondary
