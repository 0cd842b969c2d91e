#pragma once

#include "core/plugin/IRouteView.hpp"
#include <QObject>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;
class QTimer;

namespace hrb {

/// Polls GET <api>/routes in the background and serves the latest answer.
/// The body is a JSON array of objects carrying "source" (or "name") and an
/// optional "enabled" flag.
class HttpRouteView : public QObject, public IRouteView {
    Q_OBJECT
public:
    HttpRouteView(const QUrl& apiBase, int pollIntervalMs, QObject* parent = nullptr);

    void start();
    void stop();

    /// false until the first successful poll, and again after a failed one.
    bool activeRoutes(QList<ActiveRoute>& out) override;

    static bool parseRoutes(const QByteArray& body, QList<ActiveRoute>& out);

private slots:
    void poll();
    void onFinished(QNetworkReply* reply);

private:
    QUrl routesUrl_;
    QNetworkAccessManager* nam_;
    QTimer* timer_;
    QNetworkReply* pending_ = nullptr;
    bool valid_ = false;
    QList<ActiveRoute> routes_;
};

} // namespace hrb
