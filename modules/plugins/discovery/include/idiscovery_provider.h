#ifndef IDISCOVERY_PROVIDER_H
#define IDISCOVERY_PROVIDER_H

#include <functional>
#include <string>

/**
 * @brief Source of found/lost events for nearby companion devices.
 *
 * The peer id reported here is the id the transport uses for the device.
 * Filtering by platform is left to the consumer.
 */
class IDiscoveryProvider {
public:
    using FoundCallback = std::function<void(const std::string& peer_id,
                                             const std::string& platform,
                                             const std::string& name)>;
    using LostCallback = std::function<void(const std::string& peer_id)>;

    virtual ~IDiscoveryProvider() = default;

    // Must be set before start().
    virtual void setCallbacks(FoundCallback on_found, LostCallback on_lost) = 0;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
};

#endif // IDISCOVERY_PROVIDER_H
