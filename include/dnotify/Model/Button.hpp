#pragma once

#include <QString>
#include <functional>

class QDebug;

namespace dnotify {

/// A button for interactive notifications.
struct Button {
    QString title;
    std::function<void()> onPressed;  // invoked by the backend, no arguments
};

QDebug operator<<(QDebug debug, const Button& button);

} // namespace dnotify
