#ifndef PSA_ANALYSIS_COUPLING_METRICS_H
#define PSA_ANALYSIS_COUPLING_METRICS_H

#include "psa/core/types.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace psa::analysis {

    /**
     * @class CouplingCalculator
     * Afferent/efferent coupling and instability per file.
     */
    class CouplingCalculator {
    public:
        /**
         * Computes Ca, Ce and instability for every node of `graph`, isolated nodes included.
         */
        static std::unordered_map<std::string, core::CouplingMetric> calculate(
            const core::DependencyGraph& graph
        );

        /**
         * Ce / (Ce + Ca), or 0.0 when both are zero.
         */
        static double instability(std::size_t afferent, std::size_t efferent);

        /**
         * Metrics ordered by descending instability, ties broken by file path.
         */
        static std::vector<core::CouplingMetric> sorted_by_instability(
            const std::unordered_map<std::string, core::CouplingMetric>& metrics
        );
    };

}

#endif //PSA_ANALYSIS_COUPLING_METRICS_H
