#pragma once
/**
 * @file InningsRecord.h
 * @brief One historical innings as a chronological list of deliveries.
 */
#include <vector>

namespace wicketsim {
    /**
     * @brief Outcome of a single delivery.
     */
    struct Delivery {
        int runs = 0;    /**< total runs off the ball, extras included */
        int wickets = 0; /**< wickets that fell on this ball (normally 0 or 1) */
    };

    struct InningsRecord {
        std::vector<Delivery> deliveries;
    };
}
