#pragma once

#include <chrono>

namespace pairlink::core {
    class Config;
}

namespace pairlink::transfer {

struct TransferOptions {
    // Highlight every newly started transfer in the UI
    bool auto_show_active = true;
    
    std::chrono::milliseconds dismiss_delay{10000};
    std::chrono::milliseconds estimator_interval{1000};
    double smoothing_alpha = 0.4;
    
    static TransferOptions from_config(const pairlink::core::Config& config);
};

} // namespace pairlink::transfer
