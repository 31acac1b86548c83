#ifndef CLIPINSPECTOR_H
#define CLIPINSPECTOR_H

#include <QString>

namespace CER {

/**
 * @brief Summary of a finished clip file
 */
struct ClipInfo {
    bool exists = false;
    bool readable = false;     // Container could be opened and parsed
    qint64 sizeBytes = 0;
    double durationSeconds = 0.0;
    int width = 0;
    int height = 0;
    QString videoCodec;
    QString errorMessage;

    double sizeMegabytes() const { return sizeBytes / (1024.0 * 1024.0); }
};

/**
 * @brief Inspects recorded clips with libavformat
 *
 * Used after a session stops to report what was written.
 */
class ClipInspector {
public:
    static ClipInfo inspect(const QString& path);
};

} // namespace CER

#endif // CLIPINSPECTOR_H
