#include <dnotify/Model/Urgency.hpp>

namespace dnotify {

QString urgencyToString(Urgency urgency)
{
    switch (urgency) {
    case Urgency::Critical: return QStringLiteral("critical");
    case Urgency::Normal:   return QStringLiteral("normal");
    case Urgency::Low:      return QStringLiteral("low");
    }
    return QStringLiteral("normal");
}

Urgency urgencyFromString(const QString& name, bool* ok)
{
    const QString key = name.trimmed().toLower();
    if (ok) *ok = true;
    if (key == "critical") return Urgency::Critical;
    if (key == "normal") return Urgency::Normal;
    if (key == "low") return Urgency::Low;
    if (ok) *ok = false;
    return Urgency::Normal;
}

} // namespace dnotify
