#include "ridge_texture/services/http_client.hpp"
#include "ridge_texture/core/errors.hpp"

#include <QByteArray>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include <cstdlib>

namespace ridge_texture::services {

namespace {

constexpr int kStopPollMs = 50;

} // namespace

HttpResponse post_json(const std::string& url, const std::string& body,
                       const std::string& bearer_token, int timeout_ms,
                       const core::CancelToken* stop) {
    const QUrl qurl(QString::fromStdString(url));
    if (!qurl.isValid() || qurl.scheme().isEmpty()) {
        throw IOError("invalid endpoint URL: " + url);
    }

    QNetworkAccessManager nam;
    QNetworkRequest request(qurl);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setHeader(QNetworkRequest::UserAgentHeader, "RidgeTexture/1.0");
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    if (!bearer_token.empty()) {
        request.setRawHeader("Authorization",
                             QByteArray::fromStdString("Bearer " + bearer_token));
    }

    if (core::stop_requested(stop)) {
        throw IOError("POST " + url + " aborted before sending");
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QTimer stop_poll;
    stop_poll.setInterval(kStopPollMs);
    QNetworkReply* reply = nam.post(request, QByteArray::fromStdString(body));
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(&stop_poll, &QTimer::timeout, &loop, [&loop, stop]() {
        if (core::stop_requested(stop)) loop.quit();
    });
    timer.start(timeout_ms);
    if (stop) stop_poll.start();
    loop.exec();
    stop_poll.stop();

    if (!reply->isFinished()) {
        reply->abort();
        delete reply;
        if (core::stop_requested(stop)) {
            throw IOError("POST " + url + " aborted");
        }
        throw IOError("POST " + url + " timed out after " + std::to_string(timeout_ms) + " ms");
    }

    HttpResponse out;
    out.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    out.body = reply->readAll().toStdString();
    const bool transport_error = reply->error() != QNetworkReply::NoError && out.status == 0;
    const std::string error_text = reply->errorString().toStdString();
    delete reply;

    if (transport_error) {
        throw IOError("POST " + url + " failed: " + error_text);
    }
    return out;
}

std::string env_or_empty(const std::string& name) {
    if (name.empty()) return std::string();
    const char* v = std::getenv(name.c_str());
    return v ? std::string(v) : std::string();
}

} // namespace ridge_texture::services
