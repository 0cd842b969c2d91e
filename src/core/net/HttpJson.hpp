#pragma once

#include <QJsonDocument>
#include <QString>
#include <QUrl>

namespace hrb {

/// Result of a blocking JSON GET. ok == false covers transport errors,
/// timeouts, non-2xx status codes and unparsable bodies alike.
struct JsonReply {
    bool ok = false;
    int httpStatus = 0;
    QJsonDocument document;
    QString error;
};

/// Blocking GET of a JSON document with a hard timeout.
/// Spins a private QEventLoop, so it is safe to call from any thread that
/// may block (worker pool threads, CLI). Never throws.
JsonReply fetchJson(const QUrl& url, int timeoutMs);

} // namespace hrb
