#include "ConsoleProgressSink.hpp"
#include "../core/common/SizeFormat.hpp"

namespace ReelSync {

namespace {
constexpr int kBarWidth = 30;
constexpr qint64 kRedrawIntervalMs = 200;

int percentOf(qint64 done, qint64 total) {
    if (total <= 0) {
        return 100;
    }
    return static_cast<int>(qBound<qint64>(0, done * 100 / total, 100));
}
}

ConsoleProgressSink::ConsoleProgressSink(const QString& label, QTextStream& stream)
    : label_(label)
    , stream_(stream) {
}

QString ConsoleProgressSink::render(const QString& label, qint64 done, qint64 total) {
    const int percent = percentOf(done, total);
    const int filled = percent * kBarWidth / 100;
    const QString bar = QString(filled, QLatin1Char('#')) + QString(kBarWidth - filled, QLatin1Char('-'));
    return QString("%1: %2% |%3| %4/%5")
        .arg(label)
        .arg(percent, 3)
        .arg(bar, formatSize(done), formatSize(total));
}

void ConsoleProgressSink::start(qint64 totalBytes, qint64 initialBytes) {
    total_ = totalBytes;
    done_ = initialBytes;
    finished_ = false;
    lastPercent_ = -1;
    draw(true);
}

void ConsoleProgressSink::advance(qint64 bytes) {
    done_ += bytes;
    draw(false);
}

void ConsoleProgressSink::finish(bool success) {
    if (finished_) {
        return;
    }
    finished_ = true;
    draw(true);
    stream_ << (success ? "" : "  (incomplete)") << '\n';
    stream_.flush();
}

void ConsoleProgressSink::draw(bool force) {
    const int percent = percentOf(done_, total_);
    if (!force && percent == lastPercent_ && lastDraw_.isValid() && lastDraw_.elapsed() < kRedrawIntervalMs) {
        return;
    }
    lastPercent_ = percent;
    lastDraw_.start();

    stream_ << "\r\033[K" << render(label_, done_, total_);
    stream_.flush();
}

} // namespace ReelSync
