#include "SizeFormat.hpp"
#include <QtCore/QStringList>
#include <cmath>

namespace ReelSync {

QString formatSize(qint64 bytes) {
    // Byte counts are never negative
    if (bytes <= 0) return "0B";

    static const QStringList units = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    int unitIndex = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unitIndex < units.size() - 1) {
        size /= 1024.0;
        unitIndex++;
    }

    // half away from zero
    const double rounded = std::round(size * 100.0) / 100.0;
    return QString("%1 %2").arg(QString::number(rounded, 'f', 2), units[unitIndex]);
}

} // namespace ReelSync
