#ifndef LINK_HEALTH_H
#define LINK_HEALTH_H

#include <string>

#include "qdisc_state.h"

struct LinkHealth {
    int score = 100;          // 0..100
    std::string label = "good";   // good, degraded, bad, dead
};

// Rough operator-facing summary of how impaired a link is. Not a model of
// real path quality.
LinkHealth computeHealth(const ImpairmentState& state);

#endif // LINK_HEALTH_H
