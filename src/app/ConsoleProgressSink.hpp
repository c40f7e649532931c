#pragma once

#include <QtCore/QElapsedTimer>
#include <QtCore/QString>
#include <QtCore/QTextStream>
#include "../core/sync/ProgressSink.hpp"

namespace ReelSync {

/**
 * @brief Single-line terminal progress bar, redrawn in place with '\r'
 *
 * Redraws are throttled to whole-percent changes or every 200 ms.
 */
class ConsoleProgressSink : public ProgressSink {
public:
    ConsoleProgressSink(const QString& label, QTextStream& stream);

    void start(qint64 totalBytes, qint64 initialBytes) override;
    void advance(qint64 bytes) override;
    void finish(bool success) override;

    static QString render(const QString& label, qint64 done, qint64 total);

private:
    void draw(bool force);

    QString label_;
    QTextStream& stream_;
    QElapsedTimer lastDraw_;
    qint64 total_ = 0;
    qint64 done_ = 0;
    int lastPercent_ = -1;
    bool finished_ = false;
};

} // namespace ReelSync
