#pragma once

#include "idiscovery_provider.h"

#include <map>
#include <mutex>
#include <string>

// Discovery driven by the caller: announce() and withdraw() report peers while
// running. Used by the CLI ("connect" to an address) and by tests.
class ManualDiscovery : public IDiscoveryProvider {
public:
    void setCallbacks(FoundCallback on_found, LostCallback on_lost) override;
    bool start() override;
    void stop() override;
    bool isRunning() const override;

    // Remembered while stopped and reported on the next start().
    void announce(const std::string& peer_id, const std::string& platform, const std::string& name);
    void withdraw(const std::string& peer_id);

    size_t announcedCount() const;

private:
    struct Announcement {
        std::string platform;
        std::string name;
    };

    FoundCallback m_on_found;
    LostCallback m_on_lost;
    mutable std::mutex m_mutex;
    bool m_running = false;
    std::map<std::string, Announcement> m_announced;
};
