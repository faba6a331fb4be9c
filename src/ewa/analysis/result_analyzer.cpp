#include "result_analyzer.hpp"
#include <algorithm>
#include <vector>
#include "statistics.hpp"

namespace ewa::analysis {

using namespace ewa::types;

namespace {

constexpr double kMeanEpsilon = 1e-6;
constexpr size_t kMinStabilitySamples = 5;

int find_convergence_generation(const ConvergenceHistory& history, const std::vector<double>& best) {
    const size_t n = best.size();
    const size_t w = ResultAnalyzer::kPlateauWindow;
    if (n < w) {
        return static_cast<int>(n);
    }

    // 从末尾向前找连续稳定的滑窗，取最早的一个
    std::optional<size_t> first_stable_end;
    for (size_t end = n; end-- > w - 1;) {
        const auto first = best.begin() + static_cast<std::ptrdiff_t>(end + 1 - w);
        const auto last = best.begin() + static_cast<std::ptrdiff_t>(end + 1);
        if (stddev(first, last) >= ResultAnalyzer::kPlateauStdDev) break;
        first_stable_end = end;
    }

    if (!first_stable_end) {
        return static_cast<int>(n);
    }
    return history[*first_stable_end + 1 - w].generation;
}

double stability_of(const std::vector<double>& best) {
    if (best.size() < kMinStabilitySamples) {
        return 1.0;
    }
    const auto half = best.begin() + static_cast<std::ptrdiff_t>(best.size() / 2);
    return 1.0 - stddev(half, best.end()) / (mean(half, best.end()) + kMeanEpsilon);
}

} // namespace

ConvergenceAnalysis ResultAnalyzer::analyze_convergence(const ConvergenceHistory& history) const {
    ConvergenceAnalysis analysis;
    if (history.empty()) {
        return analysis;
    }

    std::vector<double> best;
    best.reserve(history.size());
    for (const auto& rec : history) {
        best.push_back(rec.best_fitness);
    }

    const double initial = best.front();
    analysis.final_best_fitness = best.back();
    analysis.final_avg_fitness = history.back().avg_fitness;
    analysis.convergence_generation = find_convergence_generation(history, best);
    analysis.improvement_ratio = initial > 0.0 ? (best.back() - initial) / initial : 0.0;
    analysis.stability = stability_of(best);
    return analysis;
}

AssignmentReport ResultAnalyzer::generate_assignment_report(const AssignmentMatrix& best,
                                                            const Scenario& scenario,
                                                            const CombatAnalyzer& analyzer) const {
    AssignmentReport report;
    const auto evaluation = analyzer.evaluate_assignment(best, scenario.radars, scenario.jammers);

    const size_t n_radars = scenario.radars.size();
    const size_t n_genes = std::min(best.size(), scenario.jammers.size());

    std::vector<int> counts(n_radars * kBandwidthCount, 0);
    for (size_t j = 0; j < n_genes; ++j) {
        const auto& gene = best[j];
        if (gene.has_target() && *gene.target < n_radars) {
            ++counts[idx_radar_bandwidth(*gene.target, gene.bandwidth)];
        }
    }

    for (size_t j = 0; j < n_genes; ++j) {
        const auto& gene = best[j];
        if (!gene.has_target()) continue;
        ++report.summary.assigned_jammers;
        if (*gene.target >= n_radars) continue;

        const auto& jammer = scenario.jammers[j];
        const auto& radar = scenario.radars[*gene.target];

        AssignmentRow row;
        row.jammer_id = jammer.id;
        row.jammer_name = jammer.name;
        row.target_id = radar.id;
        row.target_name = radar.name;
        row.technique = gene.technique;
        row.bandwidth = gene.bandwidth;
        row.effectiveness = analyzer.single_effect(
            radar, jammer, gene.technique, gene.bandwidth,
            counts[idx_radar_bandwidth(*gene.target, gene.bandwidth)]);
        row.radar_stage = radar.current_stage;
        report.assignments.push_back(std::move(row));
    }

    report.summary.total_effectiveness = evaluation.total_effectiveness;
    report.summary.resource_utilization = evaluation.resource_utilization;
    report.summary.interruption_count = evaluation.interruption_count;
    report.summary.total_jammers = static_cast<int>(scenario.jammers.size());

    for (size_t r = 0; r < n_radars; ++r) {
        report.radar_effects[scenario.radars[r].id] = evaluation.radar_effects[r];
    }
    return report;
}

} // namespace ewa::analysis
