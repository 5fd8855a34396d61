#pragma once

#include <QHashFunctions>
#include <QSet>
#include <QString>
#include <QStringList>

namespace dnotify {

/// Optional features a backend may or may not support.
enum class Capability {
    AppName,
    Title,
    Message,
    Urgency,
    Icon,
    IconFile,
    IconName,
    Buttons,
    ReplyField,
    Attachment,
    OnClicked,
    OnDismissed,
    Sound,
    SoundFile,
    SoundName,
    Thread,
    Timeout
};

inline size_t qHash(Capability capability, size_t seed = 0) noexcept
{
    return ::qHash(static_cast<int>(capability), seed);
}

using Capabilities = QSet<Capability>;

/// Stable snake_case name, e.g. "reply_field".
QString capabilityName(Capability capability);

/// Names of all capabilities in the set, in declaration order.
QStringList capabilityNames(const Capabilities& capabilities);

/// Every declared capability, in declaration order.
QList<Capability> allCapabilities();

} // namespace dnotify
