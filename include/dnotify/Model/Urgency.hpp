#pragma once

#include <QString>

namespace dnotify {

/// Notification level. Interpretation and visuals depend on the platform.
enum class Urgency {
    Critical,
    Normal,
    Low
};

QString urgencyToString(Urgency urgency);

/// Parses "critical", "normal" or "low" (case-insensitive).
/// Unknown names yield Urgency::Normal and set *ok to false.
Urgency urgencyFromString(const QString& name, bool* ok = nullptr);

} // namespace dnotify
