#ifndef COMMAND_DISPATCHER_H
#define COMMAND_DISPATCHER_H

#include "control_messages.h"

#include <optional>
#include <string>

/**
 * @brief Policy for commands received from an authenticated peer.
 *
 * start_video is acknowledged with video_ack{"starting", quality} where the
 * quality falls back to the configured default, flashlight with
 * flashlight_ack{state}. Acknowledgements themselves are never answered.
 */
class CommandDispatcher {
public:
    CommandDispatcher(bool auto_acknowledge, std::string default_video_quality);

    // Reply owed to the sender of `command`, if any.
    std::optional<Command> replyFor(const Command& command) const;

    // One-line description for logs, e.g. "flashlight(state=on)".
    static std::string describe(const Command& command);

    static bool isAcknowledgement(const Command& command);

private:
    bool m_auto_acknowledge;
    std::string m_default_video_quality;
};

#endif // COMMAND_DISPATCHER_H
