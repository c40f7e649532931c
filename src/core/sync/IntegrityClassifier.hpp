#pragma once

#include <QtCore/QFile>
#include <QtCore/QString>
#include "SyncTypes.hpp"
#include "TransferPlan.hpp"
#include "../common/CancellationToken.hpp"
#include "../common/Config.hpp"
#include "../common/Expected.hpp"
#include "../network/RemoteStore.hpp"

namespace ReelSync {

/**
 * @brief Decides what to do with the local copy of one part
 *
 * Local state is read fresh on every call and never cached. When sizes
 * differ the first min(probeBytes, localSize) bytes are compared against
 * the remote. This is a deliberately bounded check, not a full-file
 * hash: a local file whose head matches is trusted as a prefix.
 *
 * The classifier never creates, modifies or deletes files.
 */
class IntegrityClassifier {
public:
    IntegrityClassifier(RemoteStore& store, const Config::TransferSettings& settings);

    Expected<TransferPlan, SyncFailure> classify(const QString& localPath,
                                                 const RemotePart& part,
                                                 const CancellationToken& token);

private:
    // true when every sampled byte matches; a short remote body is a mismatch
    Expected<bool, SyncFailure> compareHead(QFile& local,
                                            const RemotePart& part,
                                            qint64 window,
                                            const CancellationToken& token);

    RemoteStore& store_;
    Config::TransferSettings settings_;
};

} // namespace ReelSync
