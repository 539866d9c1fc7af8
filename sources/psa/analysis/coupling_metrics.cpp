#include "psa/analysis/coupling_metrics.h"
#include "psa/graph/graph_algorithms.h"

#include <algorithm>
#include <ranges>

namespace psa::analysis {

    std::unordered_map<std::string, core::CouplingMetric> CouplingCalculator::calculate(
        const core::DependencyGraph& graph
    ) {
        std::unordered_map<std::string, core::CouplingMetric> metrics;

        const auto fanin = graph::calculate_fanin(graph);
        const auto fanout = graph::calculate_fanout(graph);

        for (const auto& node : graph.get_all_nodes()) {
            core::CouplingMetric metric;
            metric.file = node;
            metric.afferent = fanin.at(node);
            metric.efferent = fanout.at(node);
            metric.instability = instability(metric.afferent, metric.efferent);
            metrics.emplace(node, std::move(metric));
        }

        return metrics;
    }

    double CouplingCalculator::instability(const std::size_t afferent, const std::size_t efferent) {
        const std::size_t total = afferent + efferent;
        if (total == 0) {
            return 0.0;
        }
        return static_cast<double>(efferent) / static_cast<double>(total);
    }

    std::vector<core::CouplingMetric> CouplingCalculator::sorted_by_instability(
        const std::unordered_map<std::string, core::CouplingMetric>& metrics
    ) {
        std::vector<core::CouplingMetric> sorted;
        sorted.reserve(metrics.size());

        for (const auto& metric : metrics | std::views::values) {
            sorted.push_back(metric);
        }

        std::ranges::sort(sorted, [](const core::CouplingMetric& a, const core::CouplingMetric& b) {
            if (a.instability != b.instability) {
                return a.instability > b.instability;
            }
            return a.file < b.file;
        });

        return sorted;
    }

}
