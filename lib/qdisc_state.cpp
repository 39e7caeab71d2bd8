#include "qdisc_state.h"
#include "utils.h"

#include <glog/logging.h>

#include <regex>

namespace {

const std::regex& kindPattern() {
    static const std::regex pattern(R"(qdisc\s+(\S+)\s+\d+:)");
    return pattern;
}

const std::regex& delayPattern() {
    static const std::regex pattern(R"(delay\s+([\d\.]+)ms)");
    return pattern;
}

const std::regex& delayJitterPattern() {
    static const std::regex pattern(R"(delay\s+([\d\.]+)ms\s+([\d\.]+)ms)");
    return pattern;
}

const std::regex& lossPattern() {
    static const std::regex pattern(R"(loss\s+([\d\.]+)%)");
    return pattern;
}

const std::regex& tbfRatePattern() {
    static const std::regex pattern(R"(tbf\s+.*rate\s+([\d\.]+)([KMG])bit)");
    return pattern;
}

// A malformed number leaves the field absent, same as no match.
std::optional<double> captureNumber(const std::smatch& match, size_t group) {
    double value = 0.0;
    if (!parseDouble(match[group].str(), value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> toMbit(double value, char unit) {
    switch (unit) {
    case 'K':
        return value / 1000.0;
    case 'M':
        return value;
    case 'G':
        return value * 1000.0;
    default:
        return std::nullopt;
    }
}

} // namespace

const char* kindToString(ImpairmentState::Kind kind) {
    switch (kind) {
    case ImpairmentState::KIND_NETEM:
        return "netem";
    case ImpairmentState::KIND_OTHER:
        return "other";
    case ImpairmentState::KIND_NONE:
    default:
        return "none";
    }
}

ImpairmentState parseQdiscOutput(const std::string& raw) {
    ImpairmentState state;
    state.raw = trim(raw);
    if (state.raw.empty()) {
        return state;
    }

    const std::vector<std::string> lines = splitLines(state.raw);
    const std::string& first_line = lines.front();

    // only the root qdisc (first line) decides the kind
    std::smatch match;
    if (!std::regex_search(first_line, match, kindPattern())) {
        LOG(WARNING) << "Unrecognised qdisc listing, treating as no qdisc: " << first_line;
        return state;
    }
    state.kind_name = match[1].str();
    if (state.kind_name != "netem") {
        state.kind = ImpairmentState::KIND_OTHER;
        return state;
    }
    state.kind = ImpairmentState::KIND_NETEM;

    if (std::regex_search(first_line, match, delayPattern())) {
        state.delay_ms = captureNumber(match, 1);
    }
    if (state.delay_ms && std::regex_search(first_line, match, delayJitterPattern())) {
        state.jitter_ms = captureNumber(match, 2);
    }
    if (std::regex_search(first_line, match, lossPattern())) {
        state.loss_pct = captureNumber(match, 1);
    }

    for (const auto& line : lines) {
        if (!std::regex_search(line, match, tbfRatePattern())) {
            continue;
        }
        std::optional<double> value = captureNumber(match, 1);
        if (value) {
            state.rate_mbit = toMbit(*value, match[2].str()[0]);
        }
        break;
    }

    return state;
}

QdiscReader::QdiscReader(CommandRunner& runner, DeviceLocks& locks, std::string tc_path)
    : runner_(runner), locks_(locks), tc_path_(std::move(tc_path)) {}

ImpairmentState QdiscReader::readQdiscState(const std::string& interface) {
    if (!isSafeDeviceName(interface)) {
        LOG(WARNING) << "Refusing to read qdisc state of unsafe device name '" << interface << "'";
        return ImpairmentState{};
    }

    DeviceLocks::Guard guard = locks_.lock({interface});
    CommandResult result = runner_.run({tc_path_, "qdisc", "show", "dev", interface});
    if (!result.ok()) {
        // the error text goes through the same parser and matches nothing
        LOG(WARNING) << "tc qdisc show failed on " << interface << ": " << result.diagnostic();
        return parseQdiscOutput(result.err);
    }
    return parseQdiscOutput(result.out);
}
