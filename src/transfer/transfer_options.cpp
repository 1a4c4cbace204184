#include "pairlink/transfer/transfer_options.hpp"
#include "pairlink/core/config.hpp"
#include "pairlink/core/logger.hpp"

namespace pairlink::transfer {

TransferOptions TransferOptions::from_config(const pairlink::core::Config& config) {
    TransferOptions options;
    
    options.auto_show_active = config.get_bool("transfer.auto_show", options.auto_show_active);
    
    int dismiss_ms = config.get_int("transfer.dismiss_delay_ms",
                                    static_cast<int>(options.dismiss_delay.count()));
    if (dismiss_ms > 0) {
        options.dismiss_delay = std::chrono::milliseconds(dismiss_ms);
    } else {
        LOG_WARN("Ignoring transfer.dismiss_delay_ms={}, keeping {}ms",
                 dismiss_ms, options.dismiss_delay.count());
    }
    
    int interval_ms = config.get_int("transfer.estimator_interval_ms",
                                     static_cast<int>(options.estimator_interval.count()));
    if (interval_ms > 0) {
        options.estimator_interval = std::chrono::milliseconds(interval_ms);
    } else {
        LOG_WARN("Ignoring transfer.estimator_interval_ms={}, keeping {}ms",
                 interval_ms, options.estimator_interval.count());
    }
    
    double alpha = config.get_double("transfer.smoothing_alpha", options.smoothing_alpha);
    if (alpha > 0.0 && alpha <= 1.0) {
        options.smoothing_alpha = alpha;
    } else {
        LOG_WARN("Ignoring transfer.smoothing_alpha={}, keeping {}", alpha, options.smoothing_alpha);
    }
    
    return options;
}

} // namespace pairlink::transfer
