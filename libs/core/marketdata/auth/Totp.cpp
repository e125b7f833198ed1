#include "Totp.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace Totp {

std::vector<std::uint8_t> decodeBase32(std::string_view encoded) {
    std::vector<std::uint8_t> out;
    out.reserve(encoded.size() * 5 / 8);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (char raw : encoded) {
        if (raw == ' ' || raw == '-' || raw == '=') continue;

        int value = -1;
        if (raw >= 'A' && raw <= 'Z') value = raw - 'A';
        else if (raw >= 'a' && raw <= 'z') value = raw - 'a';
        else if (raw >= '2' && raw <= '7') value = raw - '2' + 26;
        if (value < 0) {
            throw std::invalid_argument(std::string("Totp: invalid base32 character '") + raw + "'");
        }

        buffer = (buffer << 5) | static_cast<std::uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFFu));
        }
    }
    return out;
}

std::string hotp(const std::vector<std::uint8_t>& key, std::uint64_t counter, int digits) {
    if (digits < 6 || digits > 9) {
        throw std::invalid_argument("Totp: digits must be between 6 and 9");
    }

    unsigned char message[8];
    for (int i = 7; i >= 0; --i) {
        message[i] = static_cast<unsigned char>(counter & 0xFFu);
        counter >>= 8;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (!HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
              message, sizeof(message), digest, &digestLen) || digestLen < 20) {
        throw std::runtime_error("Totp: HMAC-SHA1 failed");
    }

    // Dynamic truncation (RFC 4226 §5.3)
    const int offset = digest[digestLen - 1] & 0x0F;
    const std::uint32_t binary =
        (static_cast<std::uint32_t>(digest[offset] & 0x7F) << 24) |
        (static_cast<std::uint32_t>(digest[offset + 1]) << 16) |
        (static_cast<std::uint32_t>(digest[offset + 2]) << 8) |
        static_cast<std::uint32_t>(digest[offset + 3]);

    std::uint32_t modulus = 1;
    for (int i = 0; i < digits; ++i) modulus *= 10;

    std::string code = std::to_string(binary % modulus);
    if (code.size() < static_cast<std::size_t>(digits)) {
        code.insert(0, static_cast<std::size_t>(digits) - code.size(), '0');
    }
    return code;
}

std::string generate(std::string_view base32Secret,
                     std::chrono::system_clock::time_point now,
                     int digits,
                     std::chrono::seconds step) {
    const auto key = decodeBase32(base32Secret);
    if (key.empty()) {
        throw std::invalid_argument("Totp: empty secret");
    }
    const auto unixSeconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    const auto counter = static_cast<std::uint64_t>(unixSeconds / step.count());
    return hotp(key, counter, digits);
}

} // namespace Totp
