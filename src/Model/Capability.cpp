#include <dnotify/Model/Capability.hpp>

namespace dnotify {

QString capabilityName(Capability capability)
{
    switch (capability) {
    case Capability::AppName:     return QStringLiteral("app_name");
    case Capability::Title:       return QStringLiteral("title");
    case Capability::Message:     return QStringLiteral("message");
    case Capability::Urgency:     return QStringLiteral("urgency");
    case Capability::Icon:        return QStringLiteral("icon");
    case Capability::IconFile:    return QStringLiteral("icon_file");
    case Capability::IconName:    return QStringLiteral("icon_name");
    case Capability::Buttons:     return QStringLiteral("buttons");
    case Capability::ReplyField:  return QStringLiteral("reply_field");
    case Capability::Attachment:  return QStringLiteral("attachment");
    case Capability::OnClicked:   return QStringLiteral("on_clicked");
    case Capability::OnDismissed: return QStringLiteral("on_dismissed");
    case Capability::Sound:       return QStringLiteral("sound");
    case Capability::SoundFile:   return QStringLiteral("sound_file");
    case Capability::SoundName:   return QStringLiteral("sound_name");
    case Capability::Thread:      return QStringLiteral("thread");
    case Capability::Timeout:     return QStringLiteral("timeout");
    }
    return {};
}

QList<Capability> allCapabilities()
{
    return {
        Capability::AppName, Capability::Title, Capability::Message,
        Capability::Urgency, Capability::Icon, Capability::IconFile,
        Capability::IconName, Capability::Buttons, Capability::ReplyField,
        Capability::Attachment, Capability::OnClicked, Capability::OnDismissed,
        Capability::Sound, Capability::SoundFile, Capability::SoundName,
        Capability::Thread, Capability::Timeout
    };
}

QStringList capabilityNames(const Capabilities& capabilities)
{
    // Iterate the declaration order so output is stable across runs
    QStringList names;
    for (Capability c : allCapabilities()) {
        if (capabilities.contains(c))
            names.append(capabilityName(c));
    }
    return names;
}

} // namespace dnotify
