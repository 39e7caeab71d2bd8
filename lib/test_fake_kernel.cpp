#include "test_fake_kernel.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <thread>

namespace {

CommandResult fail(int status, const std::string& err) {
    CommandResult result;
    result.exit_status = status;
    result.err = err;
    return result;
}

CommandResult succeed(const std::string& out = "") {
    CommandResult result;
    result.out = out;
    return result;
}

std::string renderNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

bool hasSuffix(const std::string& text, const std::string& suffix) {
    return text.size() > suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool parseWithUnit(const std::string& token, const std::string& unit, double& value) {
    if (!hasSuffix(token, unit)) {
        return false;
    }
    return parseDouble(token.substr(0, token.size() - unit.size()), value);
}

// the device a command is "about", for overlap tracking
std::string subjectDevice(const std::vector<std::string>& argv) {
    for (size_t i = 1; i + 1 < argv.size(); ++i) {
        if (argv[i] == "dev" || argv[i] == "name") {
            return argv[i + 1];
        }
    }
    return "";
}

std::string noDevice(const std::string& name) {
    return "Cannot find device \"" + name + "\"";
}

} // namespace

std::string renderRate(double rate_mbit) {
    long long bits = std::llround(rate_mbit * 1e6);
    if (bits >= 1000000000LL && bits % 1000000000LL == 0) {
        return std::to_string(bits / 1000000000LL) + "Gbit";
    }
    if (bits >= 1000000LL && bits % 1000000LL == 0) {
        return std::to_string(bits / 1000000LL) + "Mbit";
    }
    if (bits >= 1000LL && bits % 1000LL == 0) {
        return std::to_string(bits / 1000LL) + "Kbit";
    }
    return std::to_string(bits) + "bit";
}

FakeKernel::FakeKernel() {
    Device lo;
    lo.index = next_index_++;
    lo.name = "lo";
    lo.up = true;
    lo.loopback = true;
    lo.ipv4 = {"127.0.0.1/8"};
    devices_.push_back(lo);
}

void FakeKernel::addDevice(const std::string& name, const std::vector<std::string>& ipv4,
                           const std::string& suffix) {
    std::lock_guard<std::mutex> lock(mutex_);
    Device dev;
    dev.index = next_index_++;
    dev.name = name;
    dev.suffix = suffix;
    dev.up = true;
    dev.ipv4 = ipv4;
    devices_.push_back(dev);
}

void FakeKernel::addBridge(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    Device dev;
    dev.index = next_index_++;
    dev.name = name;
    dev.bridge = true;
    dev.up = true;
    devices_.push_back(dev);
}

void FakeKernel::enslave(const std::string& device, const std::string& bridge) {
    std::lock_guard<std::mutex> lock(mutex_);
    Device* dev = find(device);
    if (dev != nullptr) {
        dev->master = bridge;
    }
}

void FakeKernel::failWhen(Predicate predicate, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back(Failure{std::move(predicate), message});
}

void FakeKernel::failOnToken(const std::string& token, const std::string& message) {
    failWhen([token](const std::vector<std::string>& argv) {
        return std::find(argv.begin(), argv.end(), token) != argv.end();
    }, message);
}

void FakeKernel::failEverything(const std::string& message) {
    failWhen([](const std::vector<std::string>&) { return true; }, message);
}

void FakeKernel::clearFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
}

void FakeKernel::setLatency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = latency;
}

CommandResult FakeKernel::run(const std::vector<std::string>& argv) {
    const std::string subject = subjectDevice(argv);
    std::chrono::milliseconds latency{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(argv);
        if (!subject.empty() && in_flight_[subject]++ > 0) {
            overlap_ = true;
        }
        latency = latency_;
    }

    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    CommandResult result = execute(argv);
    if (!subject.empty()) {
        --in_flight_[subject];
    }
    return result;
}

CommandResult FakeKernel::execute(const std::vector<std::string>& argv) {
    for (const auto& failure : failures_) {
        if (failure.predicate(argv)) {
            return fail(2, failure.message);
        }
    }
    if (argv.empty()) {
        return fail(127, "empty command");
    }

    std::string program = argv[0].substr(argv[0].find_last_of('/') + 1);
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    if (program == "ip") {
        return runIp(args);
    }
    if (program == "tc") {
        return runTc(args);
    }
    return fail(127, "failed to execute " + argv[0]);
}

CommandResult FakeKernel::runIp(const std::vector<std::string>& args) {
    using Args = std::vector<std::string>;

    if (args == Args{"-o", "link", "show"}) {
        std::string out;
        for (const auto& dev : devices_) {
            out += linkLine(dev) + "\n";
        }
        return succeed(trim(out));
    }

    if (args == Args{"-o", "addr", "show"}) {
        std::string out;
        for (const auto& dev : devices_) {
            for (const auto& address : dev.ipv4) {
                out += std::to_string(dev.index) + ": " + dev.name + dev.suffix + "    inet " + address +
                       (dev.loopback ? " scope host " : " brd 255.255.255.255 scope global ") + dev.name +
                       "\\       valid_lft forever preferred_lft forever\n";
            }
            if (!dev.loopback && !dev.bridge) {
                out += std::to_string(dev.index) + ": " + dev.name + dev.suffix +
                       "    inet6 fe80::5054:ff:fe00:" + std::to_string(dev.index) +
                       "/64 scope link \\       valid_lft forever preferred_lft forever\n";
            }
        }
        return succeed(trim(out));
    }

    if (args.size() == 4 && args[0] == "link" && args[1] == "show" && args[2] == "dev") {
        const Device* dev = find(args[3]);
        if (dev == nullptr) {
            return fail(1, "Device \"" + args[3] + "\" does not exist.");
        }
        return succeed(linkLine(*dev));
    }

    if (args.size() >= 5 && args[0] == "link" && args[1] == "set" && args[2] == "dev") {
        Device* dev = find(args[3]);
        if (dev == nullptr) {
            return fail(1, noDevice(args[3]));
        }
        const std::string& action = args[4];
        if (action == "up" && args.size() == 5) {
            dev->up = true;
            return succeed();
        }
        if (action == "down" && args.size() == 5) {
            dev->up = false;
            return succeed();
        }
        if (action == "nomaster" && args.size() == 5) {
            dev->master.clear();
            return succeed();
        }
        if (action == "master" && args.size() == 6) {
            const Device* bridge = find(args[5]);
            if (bridge == nullptr) {
                return fail(2, "Error: argument \"" + args[5] + "\" is wrong: Device does not exist");
            }
            if (!bridge->bridge) {
                return fail(2, "RTNETLINK answers: Operation not supported");
            }
            dev->master = args[5];
            return succeed();
        }
        return fail(1, "Error: either \"dev\" is duplicate, or \"" + action + "\" is a garbage.");
    }

    if (args.size() == 6 && args[0] == "link" && args[1] == "add" && args[2] == "name" && args[4] == "type" &&
        args[5] == "bridge") {
        if (find(args[3]) != nullptr) {
            return fail(2, "RTNETLINK answers: File exists");
        }
        Device dev;
        dev.index = next_index_++;
        dev.name = args[3];
        dev.bridge = true;
        devices_.push_back(dev);
        return succeed();
    }

    if (args.size() == 6 && args[0] == "link" && args[1] == "delete" && args[2] == "dev" && args[4] == "type" &&
        args[5] == "bridge") {
        auto it = std::find_if(devices_.begin(), devices_.end(),
                               [&](const Device& dev) { return dev.name == args[3]; });
        if (it == devices_.end()) {
            return fail(1, noDevice(args[3]));
        }
        if (!it->bridge) {
            return fail(2, "RTNETLINK answers: Operation not supported");
        }
        const std::string name = it->name;
        devices_.erase(it);
        for (auto& dev : devices_) {
            if (dev.master == name) {
                dev.master.clear();
            }
        }
        return succeed();
    }

    return fail(1, "Command line is not complete. Try option \"help\"");
}

CommandResult FakeKernel::runTc(const std::vector<std::string>& args) {
    if (args.size() < 4 || args[0] != "qdisc" || args[2] != "dev") {
        return fail(1, "Command line is not complete. Try option \"help\"");
    }
    Device* dev = find(args[3]);
    if (dev == nullptr) {
        return fail(1, noDevice(args[3]));
    }
    const std::string& verb = args[1];

    if (verb == "show" && args.size() == 4) {
        return succeed(qdiscText(*dev));
    }

    if (verb == "del" && args.size() == 5 && args[4] == "root") {
        if (!dev->netem) {
            return fail(2, "Error: Cannot delete qdisc with handle of zero.");
        }
        dev->netem = false;
        dev->delay_ms.reset();
        dev->jitter_ms.reset();
        dev->loss_pct.reset();
        dev->tbf_rate_mbit.reset();
        return succeed();
    }

    if (verb == "add" && args.size() >= 8 && args[4] == "root" && args[5] == "handle" && args[7] == "netem") {
        if (dev->netem) {
            return fail(2, "Error: Exclusivity flag on, cannot modify.");
        }
        Device staged = *dev;
        for (size_t i = 8; i < args.size(); ++i) {
            double value = 0.0;
            if (args[i] == "delay" && i + 1 < args.size() && parseWithUnit(args[i + 1], "ms", value)) {
                staged.delay_ms = value;
                ++i;
                if (i + 1 < args.size() && parseWithUnit(args[i + 1], "ms", value)) {
                    staged.jitter_ms = value;
                    ++i;
                }
            } else if (args[i] == "loss" && i + 1 < args.size() && parseWithUnit(args[i + 1], "%", value)) {
                staged.loss_pct = value;
                ++i;
            } else {
                return fail(1, "What is \"" + args[i] + "\"?");
            }
        }
        staged.netem = true;
        *dev = staged;
        return succeed();
    }

    if (verb == "add" && args.size() >= 10 && args[4] == "parent" && args[6] == "handle" && args[8] == "tbf") {
        if (!dev->netem || args[5] != "1:1") {
            return fail(2, "Error: Failed to find specified qdisc.");
        }
        if (dev->tbf_rate_mbit) {
            return fail(2, "Error: Exclusivity flag on, cannot modify.");
        }
        std::optional<double> rate;
        for (size_t i = 9; i + 1 < args.size(); i += 2) {
            double value = 0.0;
            if (args[i] == "rate") {
                if (parseWithUnit(args[i + 1], "gbit", value)) {
                    rate = value * 1000.0;
                } else if (parseWithUnit(args[i + 1], "mbit", value)) {
                    rate = value;
                } else if (parseWithUnit(args[i + 1], "kbit", value)) {
                    rate = value / 1000.0;
                } else {
                    return fail(1, "Illegal \"rate\"");
                }
            }
        }
        if (!rate) {
            return fail(1, "tbf: rate is required.");
        }
        dev->tbf_rate_mbit = rate;
        return succeed();
    }

    return fail(1, "Command line is not complete. Try option \"help\"");
}

FakeKernel::Device* FakeKernel::find(const std::string& name) {
    for (auto& dev : devices_) {
        if (dev.name == name) {
            return &dev;
        }
    }
    return nullptr;
}

const FakeKernel::Device* FakeKernel::find(const std::string& name) const {
    for (const auto& dev : devices_) {
        if (dev.name == name) {
            return &dev;
        }
    }
    return nullptr;
}

std::string FakeKernel::linkLine(const Device& dev) const {
    std::ostringstream line;
    line << dev.index << ": " << dev.name << dev.suffix << ": ";
    if (dev.loopback) {
        line << "<LOOPBACK,UP,LOWER_UP> mtu 65536 qdisc noqueue state UNKNOWN mode DEFAULT group default "
                "qlen 1000\\    link/loopback 00:00:00:00:00:00 brd 00:00:00:00:00:00";
        return line.str();
    }
    line << (dev.up ? "<BROADCAST,MULTICAST,UP,LOWER_UP>" : "<BROADCAST,MULTICAST>") << " mtu 1500 qdisc "
         << (dev.netem ? "netem" : (dev.bridge ? "noqueue" : "fq_codel")) << " ";
    if (!dev.master.empty()) {
        line << "master " << dev.master << " ";
    }
    line << "state " << (dev.up ? "UP" : "DOWN") << " mode DEFAULT group default qlen 1000\\    link/"
         << "ether 52:54:00:00:00:" << (dev.index < 10 ? "0" : "") << dev.index << " brd ff:ff:ff:ff:ff:ff";
    return line.str();
}

std::string FakeKernel::qdiscText(const Device& dev) const {
    if (!dev.netem) {
        if (dev.bridge || dev.loopback) {
            return "qdisc noqueue 0: root refcnt 2";
        }
        return "qdisc fq_codel 0: root refcnt 2 limit 10240p flows 1024 quantum 1514 target 5ms interval 100ms "
               "memory_limit 32Mb ecn drop_batch 64";
    }

    std::string text = "qdisc netem 1: root refcnt 2 limit 1000";
    if (dev.delay_ms) {
        text += " delay " + renderNumber(*dev.delay_ms) + "ms";
        if (dev.jitter_ms) {
            text += "  " + renderNumber(*dev.jitter_ms) + "ms";
        }
    }
    if (dev.loss_pct) {
        text += " loss " + renderNumber(*dev.loss_pct) + "%";
    }
    if (dev.tbf_rate_mbit) {
        text += "\nqdisc tbf 10: parent 1:1 rate " + renderRate(*dev.tbf_rate_mbit) + " burst 3200b lat 0us";
    }
    return text;
}

bool FakeKernel::exists(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find(name) != nullptr;
}

FakeKernel::Device FakeKernel::device(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Device* dev = find(name);
    return dev != nullptr ? *dev : Device{};
}

std::vector<std::vector<std::string>> FakeKernel::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

size_t FakeKernel::countMatching(const Predicate& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(history_.begin(), history_.end(), predicate));
}

void FakeKernel::clearHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

bool FakeKernel::sameDeviceOverlap() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overlap_;
}
