#pragma once

#include <QString>
#include <functional>

class QDebug;

namespace dnotify {

/// A reply field for interactive notifications.
/// On some platforms `title` is shown on a button that reveals the field.
struct ReplyField {
    QString title = QStringLiteral("Reply");
    QString buttonTitle = QStringLiteral("Send");
    std::function<void(const QString& text)> onReplied;
};

QDebug operator<<(QDebug debug, const ReplyField& field);

} // namespace dnotify
