#pragma once

#include <QtCore/QString>
#include <functional>
#include <memory>

namespace ReelSync {

/**
 * @brief Receiver for transfer progress events
 *
 * start() is called once per transfer with the part's full size and the
 * number of bytes already on disk (non-zero when resuming). advance() is
 * called after every chunk written; finish() when the transfer ends,
 * successfully or not.
 */
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void start(qint64 totalBytes, qint64 initialBytes) = 0;
    virtual void advance(qint64 bytes) = 0;
    virtual void finish(bool success) = 0;
};

class NullProgressSink : public ProgressSink {
public:
    void start(qint64, qint64) override {}
    void advance(qint64) override {}
    void finish(bool) override {}
};

// Creates a sink for one part; the argument is the display label
using ProgressSinkFactory = std::function<std::unique_ptr<ProgressSink>(const QString& label)>;

} // namespace ReelSync
