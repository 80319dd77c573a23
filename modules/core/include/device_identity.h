#ifndef DEVICE_IDENTITY_H
#define DEVICE_IDENTITY_H

#include <optional>
#include <string>

/**
 * @brief Stable identity of one companion device.
 *
 * Formatted as "platform_deviceName_uuid". No component may be empty or
 * contain the '_' separator, so format() and parse() are exact inverses.
 */
struct DeviceIdentifier {
    std::string platform;
    std::string device_name;
    std::string uuid;

    static constexpr char kSeparator = '_';

    std::string format() const;
    const std::string& displayName() const { return device_name; }

    // True when every component is non-empty and free of the separator.
    bool isValid() const;

    // Never throws. Empty unless the string has exactly three non-empty
    // '_'-delimited components.
    static std::optional<DeviceIdentifier> parse(const std::string& formatted);
    static bool validate(const std::string& formatted);

    /**
     * @brief Creates an identity with a fresh random (v4) UUID.
     * Separator characters in platform or name are replaced with '-'.
     * @throws std::runtime_error if libsodium cannot be initialised.
     */
    static DeviceIdentifier generate(const std::string& platform, const std::string& device_name);

    bool operator==(const DeviceIdentifier& other) const {
        return platform == other.platform && device_name == other.device_name && uuid == other.uuid;
    }
    bool operator!=(const DeviceIdentifier& other) const { return !(*this == other); }
};

// RFC 4122 version 4 UUID string (upper-case hex, 8-4-4-4-12).
std::string generate_uuid_v4();

#endif // DEVICE_IDENTITY_H
