#include "device_identity.h"
#include "logger.h"

#include <sodium.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {

void ensure_sodium() {
    if (sodium_init() < 0) {
        LOG_ERROR("Libsodium initialization failed!");
        throw std::runtime_error("Libsodium init failed");
    }
}

std::string sanitize_component(std::string value) {
    std::replace(value.begin(), value.end(), DeviceIdentifier::kSeparator, '-');
    return value;
}

bool valid_component(const std::string& value) {
    return !value.empty() && value.find(DeviceIdentifier::kSeparator) == std::string::npos;
}

} // namespace

std::string generate_uuid_v4() {
    ensure_sodium();

    uint8_t bytes[16];
    randombytes_buf(bytes, sizeof(bytes));
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }
    return out;
}

std::string DeviceIdentifier::format() const {
    std::string out;
    out.reserve(platform.size() + device_name.size() + uuid.size() + 2);
    out += platform;
    out += kSeparator;
    out += device_name;
    out += kSeparator;
    out += uuid;
    return out;
}

bool DeviceIdentifier::isValid() const {
    return valid_component(platform) && valid_component(device_name) && valid_component(uuid);
}

std::optional<DeviceIdentifier> DeviceIdentifier::parse(const std::string& formatted) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (;;) {
        auto pos = formatted.find(kSeparator, start);
        if (pos == std::string::npos) {
            parts.push_back(formatted.substr(start));
            break;
        }
        parts.push_back(formatted.substr(start, pos - start));
        if (parts.size() > 3) {
            return std::nullopt;
        }
        start = pos + 1;
    }

    if (parts.size() != 3) {
        return std::nullopt;
    }

    DeviceIdentifier id{parts[0], parts[1], parts[2]};
    if (!id.isValid()) {
        return std::nullopt;
    }
    return id;
}

bool DeviceIdentifier::validate(const std::string& formatted) {
    return parse(formatted).has_value();
}

DeviceIdentifier DeviceIdentifier::generate(const std::string& platform, const std::string& device_name) {
    DeviceIdentifier id;
    id.platform = sanitize_component(platform.empty() ? std::string("unknown") : platform);
    id.device_name = sanitize_component(device_name.empty() ? std::string("device") : device_name);
    id.uuid = generate_uuid_v4();
    return id;
}
