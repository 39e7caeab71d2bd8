#ifndef QDISC_STATE_H
#define QDISC_STATE_H

#include <optional>
#include <string>

#include "command_runner.h"
#include "device_locks.h"

// Structured view of `tc qdisc show dev <if>`.
// delay/jitter/loss come from the netem root line, rate_mbit from a tbf
// child line; the two are independent pieces of kernel state.
struct ImpairmentState {
    enum Kind { KIND_NONE, KIND_NETEM, KIND_OTHER };

    Kind kind = KIND_NONE;
    std::string kind_name;      // raw kind token, e.g. "netem", "fq_codel"
    std::optional<double> delay_ms;
    std::optional<double> jitter_ms;   // only ever set together with delay_ms
    std::optional<double> loss_pct;
    std::optional<double> rate_mbit;
    std::string raw;

    bool isNetem() const { return kind == KIND_NETEM; }
};

const char* kindToString(ImpairmentState::Kind kind);

// Never fails: text that does not follow the qdisc grammar yields an
// all-absent state.
ImpairmentState parseQdiscOutput(const std::string& raw);

class QdiscReader {
public:
    QdiscReader(CommandRunner& runner, DeviceLocks& locks, std::string tc_path);

    ImpairmentState readQdiscState(const std::string& interface);

private:
    CommandRunner& runner_;
    DeviceLocks& locks_;
    std::string tc_path_;
};

#endif // QDISC_STATE_H
