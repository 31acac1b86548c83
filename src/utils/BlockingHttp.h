#ifndef BLOCKINGHTTP_H
#define BLOCKINGHTTP_H

#include <QByteArray>
#include <QNetworkReply>
#include <QString>

class QNetworkAccessManager;
class QNetworkRequest;

namespace CER {

/**
 * @brief Outcome of a blocking HTTP request
 */
struct HttpResult {
    int status = 0;
    QByteArray body;
    QNetworkReply::NetworkError error = QNetworkReply::NoError;
    QString errorString;

    bool ok() const { return error == QNetworkReply::NoError && status >= 200 && status < 300; }
    bool authenticationFailed() const;
};

/**
 * @brief Run one request to completion on the calling thread
 * @param network Manager living on the calling thread
 * @param request Request to send
 * @param postBody POST body, or nullptr for GET
 * @param timeoutMs Transfer timeout
 *
 * Spins a local QEventLoop, so it works on worker threads that do not
 * run their own event loop.
 */
HttpResult blockingRequest(QNetworkAccessManager& network, const QNetworkRequest& request,
                           const QByteArray* postBody, int timeoutMs);

} // namespace CER

#endif // BLOCKINGHTTP_H
