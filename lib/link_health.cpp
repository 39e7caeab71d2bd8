#include "link_health.h"

#include <algorithm>
#include <cmath>

LinkHealth computeHealth(const ImpairmentState& state) {
    double delay = state.delay_ms.value_or(0.0);
    double jitter = state.jitter_ms.value_or(0.0);
    double loss = state.loss_pct.value_or(0.0);

    double score = 100.0;
    score -= std::min(delay / 3.0, 25.0);
    score -= std::min(jitter / 5.0, 15.0);
    score -= std::min(loss * 5.0, 40.0);

    if (state.rate_mbit) {
        double rate = *state.rate_mbit;
        if (rate < 1.0) {
            score -= 20.0;
        } else if (rate < 5.0) {
            score -= 15.0;
        } else if (rate < 20.0) {
            score -= 5.0;
        }
    }

    score = std::max(0.0, std::min(100.0, score));

    LinkHealth health;
    health.score = static_cast<int>(std::lround(score));
    if (score >= 80.0) {
        health.label = "good";
    } else if (score >= 50.0) {
        health.label = "degraded";
    } else if (score >= 20.0) {
        health.label = "bad";
    } else {
        health.label = "dead";
    }
    return health;
}
