#include "HttpRouteView.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QDebug>

namespace hrb {

HttpRouteView::HttpRouteView(const QUrl& apiBase, int pollIntervalMs, QObject* parent)
    : QObject(parent)
    , nam_(new QNetworkAccessManager(this))
    , timer_(new QTimer(this))
{
    QString base = apiBase.toString();
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);
    routesUrl_ = QUrl(base + QStringLiteral("/routes"));

    nam_->setProxy(QNetworkProxy::NoProxy);
    timer_->setInterval(qMax(100, pollIntervalMs));
    connect(timer_, &QTimer::timeout, this, &HttpRouteView::poll);
    connect(nam_, &QNetworkAccessManager::finished, this, &HttpRouteView::onFinished);
}

void HttpRouteView::start()
{
    qInfo() << "HttpRouteView: polling" << routesUrl_.toString();
    poll();
    timer_->start();
}

void HttpRouteView::stop()
{
    timer_->stop();
    if (pending_) {
        QNetworkReply* reply = pending_;
        pending_ = nullptr;
        reply->abort();
    }
}

bool HttpRouteView::activeRoutes(QList<ActiveRoute>& out)
{
    if (!valid_) return false;
    out = routes_;
    return true;
}

bool HttpRouteView::parseRoutes(const QByteArray& body, QList<ActiveRoute>& out)
{
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray())
        return false;

    QList<ActiveRoute> routes;
    for (const auto& value : doc.array()) {
        if (!value.isObject()) continue;
        const QJsonObject obj = value.toObject();

        ActiveRoute route;
        route.source = obj.value(QLatin1String("source")).toString();
        if (route.source.isEmpty())
            route.source = obj.value(QLatin1String("name")).toString();
        route.enabled = obj.value(QLatin1String("enabled")).toBool(true);
        if (!route.source.isEmpty())
            routes.append(route);
    }
    out = routes;
    return true;
}

void HttpRouteView::poll()
{
    if (pending_) return;  // previous request still running

    QNetworkRequest request(routesUrl_);
    request.setTransferTimeout(timer_->interval());
    pending_ = nam_->get(request);
}

void HttpRouteView::onFinished(QNetworkReply* reply)
{
    reply->deleteLater();
    if (reply == pending_)
        pending_ = nullptr;

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() != QNetworkReply::NoError || status != 200) {
        if (valid_)
            qWarning() << "HttpRouteView: route query failed:" << reply->errorString();
        valid_ = false;
        return;
    }

    QList<ActiveRoute> routes;
    if (!parseRoutes(reply->readAll(), routes)) {
        if (valid_)
            qWarning() << "HttpRouteView: malformed route list";
        valid_ = false;
        return;
    }

    routes_ = routes;
    valid_ = true;
}

} // namespace hrb
