#include "BlockingHttp.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <memory>

namespace CER {

bool HttpResult::authenticationFailed() const {
    return status == 401 || status == 403
        || error == QNetworkReply::AuthenticationRequiredError;
}

HttpResult blockingRequest(QNetworkAccessManager& network, const QNetworkRequest& request,
                           const QByteArray* postBody, int timeoutMs) {
    QNetworkRequest timedRequest(request);
    timedRequest.setTransferTimeout(timeoutMs);

    std::unique_ptr<QNetworkReply> reply(postBody ? network.post(timedRequest, *postBody)
                                                  : network.get(timedRequest));

    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    HttpResult result;
    result.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.error = reply->error();
    result.errorString = reply->errorString();
    result.body = reply->readAll();
    return result;
}

} // namespace CER
