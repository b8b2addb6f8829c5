#pragma once

namespace hq {

struct RouterSettings {
    // Input validation
    int maxQueryLength = 1000;

    // Paste-dump guard
    int pasteDumpMinLength = 100;
    double pasteDumpAlphaRatio = 0.5;
};

} // namespace hq
