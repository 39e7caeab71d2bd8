#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "process_config.h"
#include "state_store.h"
#include "wan_setup.h"
#include "lib/command_runner.h"
#include "lib/device_locks.h"
#include "lib/utils.h"

// Define flags
DEFINE_string(config, "/etc/wanem/wanem.yaml", "The emulator config file");

DEFINE_string(itf, "", "Interface for apply, clear and show.");
DEFINE_double(delay_ms, 0.0, "Netem delay in milliseconds, 0 disables.");
DEFINE_double(jitter_ms, 0.0, "Netem jitter in milliseconds, needs a delay.");
DEFINE_double(loss_pct, 0.0, "Random loss in percent, 0 disables.");
DEFINE_double(rate_mbit, 0.0, "Bandwidth cap in Mbit/s, 0 disables.");

namespace {

const int kExitOk = 0;
const int kExitFailure = 1;
const int kExitPartial = 2;
const int kExitUsage = 64;

const char* kUsage =
    "<command> [args]\n"
    "  interfaces                      list host interfaces and their roles\n"
    "  setup [NAME=]INNER:OUTER ...    bridge each pair as one WAN link\n"
    "  apply --itf=IF [--delay_ms=D --jitter_ms=J --loss_pct=L --rate_mbit=R]\n"
    "  clear --itf=IF                  remove shaping from an inner interface\n"
    "  show [--itf=IF]                 parsed qdisc state (all inner interfaces if omitted)\n"
    "  status                          WAN links with health\n"
    "  reset                           delete bridges, clear qdiscs, forget links";

bool parseLinkArgument(const std::string& arg, LinkRequest& request) {
    std::string pair = arg;
    size_t equals = arg.find('=');
    if (equals != std::string::npos) {
        request.name = trim(arg.substr(0, equals));
        pair = arg.substr(equals + 1);
    }
    size_t colon = pair.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    request.inner = trim(pair.substr(0, colon));
    request.outer = trim(pair.substr(colon + 1));
    return !request.inner.empty() && !request.outer.empty();
}

std::string optionalValue(const std::optional<double>& value, int precision) {
    return value ? formatFixed(*value, precision) : "-";
}

void printState(const std::string& itf, const ImpairmentState& state) {
    std::cout << itf << ": kind=" << (state.kind_name.empty() ? kindToString(state.kind) : state.kind_name)
              << " delay_ms=" << optionalValue(state.delay_ms, 1)
              << " jitter_ms=" << optionalValue(state.jitter_ms, 1)
              << " loss_pct=" << optionalValue(state.loss_pct, 3)
              << " rate_mbit=" << optionalValue(state.rate_mbit, 3) << "\n";
    LinkHealth health = computeHealth(state);
    std::cout << "  health: " << health.score << " (" << health.label << ")\n";
    if (!state.raw.empty()) {
        for (const auto& line : splitLines(state.raw)) {
            std::cout << "  | " << line << "\n";
        }
    }
}

int listInterfaces(WanSetup& setup) {
    std::vector<NetworkInterface> interfaces = setup.interfaces();
    if (interfaces.empty()) {
        std::cout << "no interfaces available\n";
        return kExitOk;
    }
    for (const auto& iface : interfaces) {
        std::cout << std::left << std::setw(16) << iface.name << std::setw(12) << roleToString(iface.role)
                  << (iface.up ? "up  " : "down");
        if (!iface.master.empty()) {
            std::cout << " master " << iface.master;
        }
        for (const auto& address : iface.ipv4) {
            std::cout << " " << address;
        }
        std::cout << "\n";
    }
    return kExitOk;
}

int runSetup(WanSetup& setup, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "eligible interfaces:";
        for (const auto& name : setup.setupCandidates()) {
            std::cout << " " << name;
        }
        std::cout << "\n";
        return kExitUsage;
    }

    std::vector<LinkRequest> requests;
    for (const auto& arg : args) {
        LinkRequest request;
        if (!parseLinkArgument(arg, request)) {
            std::cerr << "Malformed link '" << arg << "', expected [NAME=]INNER:OUTER" << std::endl;
            return kExitUsage;
        }
        requests.push_back(request);
    }

    std::vector<LinkOutcome> outcomes;
    try {
        outcomes = setup.configure(requests);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Rejected: " << e.what() << std::endl;
        return kExitUsage;
    }

    int rc = kExitOk;
    for (const auto& outcome : outcomes) {
        std::cout << outcome.link.name << ": " << outcome.link.bridge << " (" << outcome.link.inner << " <-> "
                  << outcome.link.outer << ") ";
        if (outcome.bridge.ok) {
            std::cout << "ok\n";
        } else {
            std::cout << "FAILED at " << outcome.bridge.step << ": " << outcome.bridge.reason << "\n";
            rc = kExitFailure;
        }
    }
    return rc;
}

int runApply(WanSetup& setup) {
    if (FLAGS_itf.empty()) {
        std::cerr << "apply needs --itf" << std::endl;
        return kExitUsage;
    }
    ImpairmentRequest request;
    request.delay_ms = FLAGS_delay_ms;
    request.jitter_ms = FLAGS_jitter_ms;
    request.loss_pct = FLAGS_loss_pct;
    request.rate_mbit = FLAGS_rate_mbit;

    ImpairmentResult result = setup.apply(FLAGS_itf, request);
    if (result.ok) {
        std::cout << "Applied netem on " << FLAGS_itf << ": OK\n";
        return kExitOk;
    }
    if (result.partial()) {
        std::cout << "Netem OK on " << FLAGS_itf << ", but tbf failed: " << result.reason << "\n";
        return kExitPartial;
    }
    std::cout << "Failed to apply netem on " << FLAGS_itf << " (" << stageToString(result.stage)
              << "): " << result.reason << "\n";
    return kExitFailure;
}

int runClear(WanSetup& setup) {
    if (FLAGS_itf.empty()) {
        std::cerr << "clear needs --itf" << std::endl;
        return kExitUsage;
    }
    if (!setup.clear(FLAGS_itf)) {
        return kExitFailure;
    }
    std::cout << "Cleared qdisc on " << FLAGS_itf << "\n";
    return kExitOk;
}

int runShow(WanSetup& setup) {
    if (!FLAGS_itf.empty()) {
        printState(FLAGS_itf, setup.show(FLAGS_itf));
        return kExitOk;
    }
    for (const auto& status : setup.status()) {
        printState(status.link.inner, status.inner_state);
    }
    return kExitOk;
}

int runStatus(WanSetup& setup) {
    std::cout << "management interface: " << setup.managementInterface() << "\n";
    std::vector<LinkStatus> statuses = setup.status();
    if (statuses.empty()) {
        std::cout << "no WAN links configured, run setup first\n";
        return kExitOk;
    }
    for (const auto& status : statuses) {
        const WanLink& link = status.link;
        std::cout << link.name << " [" << link.bridge << "] inner=" << link.inner << " outer=" << link.outer
                  << " health=" << status.health.score << " (" << status.health.label << ")\n";
        if (link.last_requested) {
            std::cout << "  requested: delay_ms=" << link.last_requested->delay_ms
                      << " jitter_ms=" << link.last_requested->jitter_ms
                      << " loss_pct=" << link.last_requested->loss_pct
                      << " rate_mbit=" << link.last_requested->rate_mbit << "\n";
        }
        printState(link.inner, status.inner_state);
    }
    return kExitOk;
}

} // namespace


int main(int argc, char* argv[]) {
    gflags::SetUsageMessage(std::string("wanemctl ") + kUsage);
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    google::InitGoogleLogging(argv[0]);

    FLAGS_logtostderr = true;

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " " << kUsage << std::endl;
        return kExitUsage;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    LOG(INFO) << "loading config from " << FLAGS_config;
    EmulatorConfig config;
    try {
        config.parseConfig(FLAGS_config);
    } catch (const ConfigParseException& e) {
        LOG(ERROR) << e.what();
        return kExitFailure;
    }

    SubprocessRunner runner(std::chrono::milliseconds(config.commandTimeoutMs));
    DeviceLocks locks;
    InterfaceInventory inventory(runner, config.ipPath);
    BridgeManager bridges(runner, locks, config.ipPath);
    ImpairmentController impairments(runner, locks, config.tcPath);
    QdiscReader qdiscs(runner, locks, config.tcPath);
    LinkRegistry registry;
    StateStore store(config.stateFile);

    int rc = kExitFailure;
    try {
        if (command == "reset") {
            // reset must still work when the state file itself is the problem
            store.loadOrDiscard(registry);
        } else {
            store.load(registry);
        }
        WanSetup setup(config, inventory, bridges, impairments, qdiscs, registry, store);

        if (command == "interfaces") {
            rc = listInterfaces(setup);
        } else if (command == "setup") {
            rc = runSetup(setup, args);
        } else if (command == "apply") {
            rc = runApply(setup);
        } else if (command == "clear") {
            rc = runClear(setup);
        } else if (command == "show") {
            rc = runShow(setup);
        } else if (command == "status") {
            rc = runStatus(setup);
        } else if (command == "reset") {
            setup.reset();
            std::cout << "Configuration reset. Bridges removed and qdiscs cleared.\n";
            rc = kExitOk;
        } else {
            std::cerr << "Unknown command: " << command << "\nUsage: " << argv[0] << " " << kUsage << std::endl;
            rc = kExitUsage;
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << command << " failed: " << e.what();
        rc = kExitFailure;
    }

    google::ShutdownGoogleLogging();
    return rc;
}
