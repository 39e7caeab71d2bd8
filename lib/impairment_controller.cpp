#include "impairment_controller.h"
#include "utils.h"

#include <glog/logging.h>

#include <cmath>

namespace {

bool requested(double value) {
    return value > 0.0;
}

} // namespace

const char* stageToString(ImpairmentResult::Stage stage) {
    switch (stage) {
    case ImpairmentResult::STAGE_VALIDATE:
        return "validate";
    case ImpairmentResult::STAGE_NETEM:
        return "netem";
    case ImpairmentResult::STAGE_TBF:
        return "tbf";
    case ImpairmentResult::STAGE_NONE:
    default:
        return "none";
    }
}

std::vector<std::string> netemArguments(const ImpairmentRequest& request) {
    std::vector<std::string> args;
    if (requested(request.delay_ms)) {
        args.push_back("delay");
        args.push_back(formatFixed(request.delay_ms, 1) + "ms");
        if (requested(request.jitter_ms)) {
            args.push_back(formatFixed(request.jitter_ms, 1) + "ms");
        }
    }
    if (requested(request.loss_pct)) {
        args.push_back("loss");
        args.push_back(formatFixed(request.loss_pct, 3) + "%");
    }
    return args;
}

std::vector<std::string> tbfArguments(double rate_mbit) {
    return {"rate", formatFixed(rate_mbit, 3) + "mbit",
            "buffer", ImpairmentController::kTbfBuffer,
            "limit", ImpairmentController::kTbfLimit};
}

ImpairmentController::ImpairmentController(CommandRunner& runner, DeviceLocks& locks, std::string tc_path)
    : runner_(runner), locks_(locks), tc_path_(std::move(tc_path)) {}

ImpairmentResult ImpairmentController::applyImpairment(const std::string& interface, double delay_ms,
                                                       double jitter_ms, double loss_pct, double rate_mbit) {
    ImpairmentRequest request;
    request.delay_ms = delay_ms;
    request.jitter_ms = jitter_ms;
    request.loss_pct = loss_pct;
    request.rate_mbit = rate_mbit;
    return applyImpairment(interface, request);
}

ImpairmentResult ImpairmentController::applyImpairment(const std::string& interface,
                                                       const ImpairmentRequest& request) {
    if (!isSafeDeviceName(interface)) {
        return ImpairmentResult{false, ImpairmentResult::STAGE_VALIDATE,
                                "invalid device name '" + interface + "'"};
    }
    for (double value : {request.delay_ms, request.jitter_ms, request.loss_pct, request.rate_mbit}) {
        // -inf is just another non-positive value, i.e. not requested
        if (std::isinf(value) && value > 0.0) {
            return ImpairmentResult{false, ImpairmentResult::STAGE_VALIDATE, "impairment values must be finite"};
        }
    }
    if (request.loss_pct > 100.0) {
        return ImpairmentResult{false, ImpairmentResult::STAGE_VALIDATE,
                                "loss must be at most 100%, got " + formatFixed(request.loss_pct, 3)};
    }

    DeviceLocks::Guard guard = locks_.lock({interface});

    clearLocked(interface);

    std::vector<std::string> netem = {tc_path_, "qdisc", "add", "dev", interface, "root", "handle", kNetemHandle,
                                      "netem"};
    for (auto& arg : netemArguments(request)) {
        netem.push_back(std::move(arg));
    }
    CommandResult netem_result = runner_.run(netem);
    if (!netem_result.ok()) {
        LOG(ERROR) << "Failed to apply netem on " << interface << ": " << netem_result.diagnostic();
        return ImpairmentResult{false, ImpairmentResult::STAGE_NETEM, netem_result.diagnostic()};
    }

    if (requested(request.rate_mbit)) {
        std::vector<std::string> tbf = {tc_path_, "qdisc", "add", "dev", interface, "parent", kTbfParent,
                                        "handle", kTbfHandle, "tbf"};
        for (auto& arg : tbfArguments(request.rate_mbit)) {
            tbf.push_back(std::move(arg));
        }
        CommandResult tbf_result = runner_.run(tbf);
        if (!tbf_result.ok()) {
            LOG(ERROR) << "Netem active on " << interface << " but tbf failed: " << tbf_result.diagnostic();
            return ImpairmentResult{false, ImpairmentResult::STAGE_TBF, tbf_result.diagnostic()};
        }
    }

    LOG(INFO) << "Impairment applied on " << interface << ": delay=" << request.delay_ms
              << "ms jitter=" << request.jitter_ms << "ms loss=" << request.loss_pct
              << "% rate=" << request.rate_mbit << "mbit";
    return ImpairmentResult{};
}

bool ImpairmentController::clearImpairment(const std::string& interface) {
    if (!isSafeDeviceName(interface)) {
        LOG(ERROR) << "Refusing to clear qdisc on unsafe device name '" << interface << "'";
        return false;
    }
    DeviceLocks::Guard guard = locks_.lock({interface});
    clearLocked(interface);
    return true;
}

void ImpairmentController::clearLocked(const std::string& interface) {
    CommandResult result = runner_.run({tc_path_, "qdisc", "del", "dev", interface, "root"});
    if (!result.ok()) {
        // usually "no qdisc to delete"
        LOG(INFO) << "Nothing cleared on " << interface << ": " << result.diagnostic();
    }
}
