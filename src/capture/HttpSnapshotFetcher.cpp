#include "HttpSnapshotFetcher.h"
#include "core/Config.h"
#include "utils/BlockingHttp.h"
#include "utils/Logging.h"

#include <QNetworkRequest>
#include <QRandomGenerator>
#include <QUrl>
#include <QUrlQuery>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <vector>

namespace CER {

HttpSnapshotFetcher::HttpSnapshotFetcher(int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
}

bool HttpSnapshotFetcher::fetch(const DeviceConfig& device, QByteArray* image, QString* errorMessage) {
    QUrl url(device.snapshotRequestUrl());
    if (!url.isValid()) {
        if (errorMessage) {
            *errorMessage = QString("invalid snapshot URL for %1").arg(device.name);
        }
        return false;
    }

    if (device.snapshotUrl.isEmpty()) {
        QUrlQuery query(url);
        query.addQueryItem("rs", QString::number(QRandomGenerator::global()->generate(), 16));
        url.setQuery(query);
    }

    QNetworkRequest request(url);
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);

    const HttpResult result = blockingRequest(m_network, request, nullptr, m_timeoutMs);
    if (!result.ok()) {
        if (errorMessage) {
            *errorMessage = result.status > 0
                ? QString("HTTP %1 from snapshot endpoint").arg(result.status)
                : result.errorString;
        }
        return false;
    }

    QSize size;
    if (!inspectImage(result.body, &size, errorMessage)) {
        return false;
    }

    qCDebug(lcSession).noquote() << deviceTag(device.name) << "snapshot"
                                 << size.width() << "x" << size.height()
                                 << result.body.size() << "bytes";
    if (image) {
        *image = result.body;
    }
    return true;
}

bool HttpSnapshotFetcher::inspectImage(const QByteArray& data, QSize* size, QString* errorMessage) {
    if (data.isEmpty()) {
        if (errorMessage) {
            *errorMessage = "empty snapshot payload";
        }
        return false;
    }

    const std::vector<uchar> buffer(data.constBegin(), data.constEnd());
    cv::Mat decoded;
    try {
        decoded = cv::imdecode(buffer, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        if (errorMessage) {
            *errorMessage = QString("snapshot decode failed: %1").arg(QString::fromStdString(e.msg));
        }
        return false;
    }

    if (decoded.empty()) {
        if (errorMessage) {
            // Cameras report auth and parameter errors as a short JSON body
            *errorMessage = QString("snapshot payload is not an image: %1")
                                .arg(QString::fromUtf8(data.left(120)).simplified());
        }
        return false;
    }

    if (size) {
        *size = QSize(decoded.cols, decoded.rows);
    }
    return true;
}

} // namespace CER
