#include "HttpJson.hpp"
#include <QEventLoop>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <memory>

namespace hrb {

JsonReply fetchJson(const QUrl& url, int timeoutMs)
{
    JsonReply result;

    // One manager per call: QNetworkAccessManager is bound to its thread and
    // probes run concurrently from the sweep pool.
    QNetworkAccessManager nam;
    nam.setProxy(QNetworkProxy::NoProxy);

    QNetworkRequest request(url);
    request.setTransferTimeout(timeoutMs);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    std::unique_ptr<QNetworkReply> reply(nam.get(request));

    QEventLoop loop;
    QTimer guard;
    guard.setSingleShot(true);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&guard, &QTimer::timeout, &loop, [&]() {
        reply->abort();
        loop.quit();
    });
    guard.start(timeoutMs + 250);
    if (!reply->isFinished())
        loop.exec();
    guard.stop();

    result.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    if (!reply->isFinished() || reply->error() != QNetworkReply::NoError) {
        result.error = reply->isFinished() ? reply->errorString() : QStringLiteral("timed out");
        return result;
    }
    if (result.httpStatus < 200 || result.httpStatus >= 300) {
        result.error = QStringLiteral("HTTP status %1").arg(result.httpStatus);
        return result;
    }

    QJsonParseError parseError;
    result.document = QJsonDocument::fromJson(reply->readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        result.error = parseError.errorString();
        result.document = {};
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace hrb
