#include "ClipInspector.h"

#include <QFileInfo>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace CER {

namespace {

QString averrorString(int code) {
    char errBuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(code, errBuf, sizeof(errBuf));
    return QString::fromUtf8(errBuf);
}

} // namespace

ClipInfo ClipInspector::inspect(const QString& path) {
    ClipInfo info;

    const QFileInfo file(path);
    info.exists = file.exists();
    if (!info.exists) {
        info.errorMessage = "file does not exist";
        return info;
    }
    info.sizeBytes = file.size();
    if (info.sizeBytes == 0) {
        info.errorMessage = "file is empty";
        return info;
    }

    AVFormatContext* formatContext = nullptr;
    int ret = avformat_open_input(&formatContext, path.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        info.errorMessage = QString("cannot open container: %1").arg(averrorString(ret));
        return info;
    }

    ret = avformat_find_stream_info(formatContext, nullptr);
    if (ret < 0) {
        info.errorMessage = QString("cannot read stream info: %1").arg(averrorString(ret));
        avformat_close_input(&formatContext);
        return info;
    }

    if (formatContext->duration != AV_NOPTS_VALUE) {
        info.durationSeconds = static_cast<double>(formatContext->duration) / AV_TIME_BASE;
    }

    for (unsigned int i = 0; i < formatContext->nb_streams; i++) {
        const AVCodecParameters* codecPar = formatContext->streams[i]->codecpar;
        if (codecPar->codec_type == AVMEDIA_TYPE_VIDEO) {
            info.width = codecPar->width;
            info.height = codecPar->height;
            info.videoCodec = QString::fromUtf8(avcodec_get_name(codecPar->codec_id));
            break;
        }
    }

    info.readable = true;
    avformat_close_input(&formatContext);
    return info;
}

} // namespace CER
