#pragma once

#include <QtCore/QtGlobal>
#include <variant>

namespace ReelSync {

// Local copy already matches the remote size
struct Skip {};

// Local file is a verified prefix of the remote content
struct ResumeFrom {
    qint64 offset = 0;
};

// Fetch everything from byte zero
struct Redownload {
    bool discardLocal = false;    // a stale local file exists and must be removed first
    bool probeUnresolved = false; // head-sample probe failed; decision is conservative
};

using TransferAction = std::variant<Skip, ResumeFrom, Redownload>;

struct TransferPlan {
    TransferAction action;
    qint64 pendingBytes = 0;      // contribution to the job's bytes-to-transfer total

    bool needsTransfer() const { return !std::holds_alternative<Skip>(action); }

    static TransferPlan skip() { return TransferPlan{Skip{}, 0}; }
    static TransferPlan resume(qint64 offset, qint64 declaredSize) {
        return TransferPlan{ResumeFrom{offset}, declaredSize - offset};
    }
    static TransferPlan redownload(qint64 declaredSize, bool discardLocal, bool probeUnresolved = false) {
        return TransferPlan{Redownload{discardLocal, probeUnresolved}, declaredSize};
    }
};

// Overload set for std::visit
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace ReelSync
