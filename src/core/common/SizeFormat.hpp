#pragma once

#include <QtCore/QString>

namespace ReelSync {

// Binary units with two decimals, e.g. 1536 -> "1.50 KiB". Zero is "0B".
QString formatSize(qint64 bytes);

} // namespace ReelSync
