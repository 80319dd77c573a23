#include "command_dispatcher.h"

#include <sstream>
#include <utility>

CommandDispatcher::CommandDispatcher(bool auto_acknowledge, std::string default_video_quality)
    : m_auto_acknowledge(auto_acknowledge), m_default_video_quality(std::move(default_video_quality)) {
    if (m_default_video_quality.empty()) {
        m_default_video_quality = "high";
    }
}

std::optional<Command> CommandDispatcher::replyFor(const Command& command) const {
    if (!m_auto_acknowledge) {
        return std::nullopt;
    }
    if (const auto* start = std::get_if<StartVideoCommand>(&command)) {
        VideoAckCommand ack;
        ack.status = "starting";
        ack.quality = start->quality.empty() ? m_default_video_quality : start->quality;
        return Command{ack};
    }
    if (const auto* flash = std::get_if<FlashlightCommand>(&command)) {
        return Command{FlashlightAckCommand{flash->state}};
    }
    return std::nullopt;
}

std::string CommandDispatcher::describe(const Command& command) {
    std::ostringstream out;
    out << command_name(command);
    if (const auto* c = std::get_if<StartVideoCommand>(&command)) {
        out << "(quality=" << (c->quality.empty() ? "default" : c->quality) << ")";
    } else if (const auto* c = std::get_if<FlashlightCommand>(&command)) {
        out << "(state=" << (c->state ? "on" : "off") << ")";
    } else if (const auto* c = std::get_if<SetFlashIntensityCommand>(&command)) {
        out << "(intensity=" << c->intensity << ")";
    } else if (const auto* c = std::get_if<VideoAckCommand>(&command)) {
        out << "(status=" << c->status << ", quality=" << c->quality << ")";
    } else if (const auto* c = std::get_if<FlashlightAckCommand>(&command)) {
        out << "(state=" << (c->state ? "on" : "off") << ")";
    } else if (const auto* c = std::get_if<StartPreviewCommand>(&command)) {
        out << "(quality=" << (c->quality.empty() ? "default" : c->quality) << ")";
    }
    return out.str();
}

bool CommandDispatcher::isAcknowledgement(const Command& command) {
    return std::holds_alternative<VideoAckCommand>(command) ||
           std::holds_alternative<FlashlightAckCommand>(command);
}
