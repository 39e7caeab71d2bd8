#ifndef IMPAIRMENT_CONTROLLER_H
#define IMPAIRMENT_CONTROLLER_H

#include <string>
#include <vector>

#include "command_runner.h"
#include "device_locks.h"

// Values an operator asks for. Zero, negative or NaN means "not requested".
struct ImpairmentRequest {
    double delay_ms = 0.0;
    double jitter_ms = 0.0;
    double loss_pct = 0.0;
    double rate_mbit = 0.0;
};

struct ImpairmentResult {
    enum Stage { STAGE_NONE, STAGE_VALIDATE, STAGE_NETEM, STAGE_TBF };

    bool ok = true;
    Stage stage = STAGE_NONE;
    std::string reason;

    // netem is active but the rate cap is not
    bool partial() const { return !ok && stage == STAGE_TBF; }
};

const char* stageToString(ImpairmentResult::Stage stage);

// Netem clauses: "delay <d>ms [<j>ms]" and "loss <l>%", each value its own token.
std::vector<std::string> netemArguments(const ImpairmentRequest& request);

// "rate <r>mbit buffer 3200 limit 32768"
std::vector<std::string> tbfArguments(double rate_mbit);

// Drives the netem root + optional tbf child on one interface. Every apply
// starts from a cleared root so stale handles and parameters never mix.
class ImpairmentController {
public:
    static constexpr const char* kNetemHandle = "1:0";
    static constexpr const char* kTbfParent = "1:1";
    static constexpr const char* kTbfHandle = "10:";
    static constexpr const char* kTbfBuffer = "3200";
    static constexpr const char* kTbfLimit = "32768";

    ImpairmentController(CommandRunner& runner, DeviceLocks& locks, std::string tc_path);

    ImpairmentResult applyImpairment(const std::string& interface, double delay_ms, double jitter_ms,
                                     double loss_pct, double rate_mbit);
    ImpairmentResult applyImpairment(const std::string& interface, const ImpairmentRequest& request);

    // Removes the root qdisc. Nothing to remove still counts as success;
    // false only for a device name that was refused.
    bool clearImpairment(const std::string& interface);

private:
    void clearLocked(const std::string& interface);

    CommandRunner& runner_;
    DeviceLocks& locks_;
    std::string tc_path_;
};

#endif // IMPAIRMENT_CONTROLLER_H
