#include "epde_optimizer.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <numeric>
#include <glog/logging.h>
#include "../model/effectiveness_model.hpp"

namespace ewa::optim {

using namespace ewa::types;
using ewa::model::EffectivenessModel;

namespace {

using clock = std::chrono::steady_clock;

inline double seconds_since(clock::time_point start) {
    return std::chrono::duration<double>(clock::now() - start).count();
}

inline bool chance(Rng& rng, double p) {
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng) < p;
}

inline size_t pick(Rng& rng, size_t n) {
    return std::uniform_int_distribution<size_t>(0, n - 1)(rng);
}

inline double clamp_rate(double v, const char* name) {
    if (v < 0.0 || v > 1.0) {
        LOG(WARNING) << "ePDE config: " << name << "=" << v << " outside [0,1], clamped";
        return std::max(0.0, std::min(1.0, v));
    }
    return v;
}

ewa::config::EpdeConfig sanitize(ewa::config::EpdeConfig cfg) {
    if (cfg.population_size < 1) {
        LOG(WARNING) << "ePDE config: population_size=" << cfg.population_size << ", using 1";
        cfg.population_size = 1;
    }
    if (cfg.max_generations < 0) {
        LOG(WARNING) << "ePDE config: max_generations=" << cfg.max_generations << ", using 0";
        cfg.max_generations = 0;
    }
    if (!(cfg.time_limit_sec >= 0.0)) {
        LOG(WARNING) << "ePDE config: time_limit_sec=" << cfg.time_limit_sec << ", using 0";
        cfg.time_limit_sec = 0.0;
    }
    cfg.crossover_rate = clamp_rate(cfg.crossover_rate, "crossover_rate");
    cfg.scaling_factor = clamp_rate(cfg.scaling_factor, "scaling_factor");
    cfg.mutation.mutation_rate = clamp_rate(cfg.mutation.mutation_rate, "mutation_rate");
    cfg.mutation.inherit_prob = clamp_rate(cfg.mutation.inherit_prob, "inherit_prob");
    return cfg;
}

// 从除 current 以外的个体中取三个，个体不足时允许重复
std::array<size_t, 3> sample_donors(size_t n, size_t current, Rng& rng) {
    std::vector<size_t> others;
    others.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (i != current) others.push_back(i);
    }
    if (others.empty()) {
        return {current, current, current};
    }
    if (others.size() < 3) {
        return {others[pick(rng, others.size())],
                others[pick(rng, others.size())],
                others[pick(rng, others.size())]};
    }
    // 部分 Fisher-Yates
    for (size_t k = 0; k < 3; ++k) {
        const size_t j = k + pick(rng, others.size() - k);
        std::swap(others[k], others[j]);
    }
    return {others[0], others[1], others[2]};
}

} // namespace

std::vector<int> count_radar_bandwidth(const AssignmentMatrix& matrix, size_t n_radars) {
    std::vector<int> counts(n_radars * kBandwidthCount, 0);
    for (const auto& gene : matrix.genes) {
        if (gene.has_target() && *gene.target < n_radars) {
            ++counts[idx_radar_bandwidth(*gene.target, gene.bandwidth)];
        }
    }
    return counts;
}

EpdeOptimizer::EpdeOptimizer(const ewa::config::EpdeConfig& cfg)
    : cfg_(sanitize(cfg)) {
}

Population EpdeOptimizer::initialize_population(const Scenario& scenario, Rng& rng) const {
    const size_t n_radars = scenario.radars.size();
    Population population;
    population.reserve(cfg_.population_size);

    for (int p = 0; p < cfg_.population_size; ++p) {
        AssignmentMatrix individual;
        individual.genes.resize(scenario.jammers.size());
        for (auto& gene : individual.genes) {
            if (n_radars == 0) {
                gene.target.reset();
                continue;
            }
            gene.target = static_cast<RadarIndex>(pick(rng, n_radars));
            gene.technique = static_cast<JammingTechnique>(pick(rng, kTechniqueCount));
            gene.bandwidth = static_cast<BandwidthMode>(pick(rng, kBandwidthCount));
        }
        population.push_back(std::move(individual));
    }
    return population;
}

AssignmentMatrix EpdeOptimizer::mutate(const Population& population, size_t current, Rng& rng) const {
    const auto [a, b, c] = sample_donors(population.size(), current, rng);
    const auto& ind_a = population[a];
    const auto& ind_b = population[b];
    const auto& ind_c = population[c];

    // 离散版 a + F·(b − c)：按 F 在 b、c 之间取基因
    AssignmentMatrix mutant;
    mutant.genes.resize(ind_a.size());
    for (size_t j = 0; j < ind_a.size(); ++j) {
        if (!chance(rng, cfg_.mutation.mutation_rate) || chance(rng, cfg_.mutation.inherit_prob)) {
            mutant[j] = ind_a[j];
            continue;
        }
        const bool b_real = j < ind_b.size() && ind_b[j].has_target();
        const bool c_real = j < ind_c.size() && ind_c[j].has_target();
        if (b_real && c_real) {
            mutant[j] = chance(rng, cfg_.scaling_factor) ? ind_b[j] : ind_c[j];
        } else {
            mutant[j] = ind_a[j];
        }
    }
    return mutant;
}

AssignmentMatrix EpdeOptimizer::crossover(const AssignmentMatrix& target,
                                          const AssignmentMatrix& mutant,
                                          Rng& rng) const {
    AssignmentMatrix trial;
    trial.genes.resize(target.size());
    for (size_t j = 0; j < target.size(); ++j) {
        const bool from_mutant = j < mutant.size() && chance(rng, cfg_.crossover_rate);
        trial[j] = from_mutant ? mutant[j] : target[j];
    }
    return trial;
}

AssignmentMatrix EpdeOptimizer::repair(AssignmentMatrix trial, const Scenario& scenario, Rng& rng) const {
    const size_t n_radars = scenario.radars.size();

    // 每部干扰机恰好一个基因
    trial.genes.resize(scenario.jammers.size());

    // 1. 悬空目标
    for (auto& gene : trial.genes) {
        if (!gene.has_target() || *gene.target < n_radars) continue;
        if (n_radars > 0) {
            gene.target = static_cast<RadarIndex>(pick(rng, n_radars));
        } else {
            gene.target.reset();
        }
    }

    // 2. 带宽容量
    auto counts = count_radar_bandwidth(trial, n_radars);
    for (auto& gene : trial.genes) {
        if (!gene.has_target()) continue;
        const int cap = EffectivenessModel::max_targets(gene.bandwidth);
        auto& here = counts[idx_radar_bandwidth(*gene.target, gene.bandwidth)];
        if (here <= cap) continue;

        std::optional<RadarIndex> best;
        int best_load = cap;
        for (size_t r = 0; r < n_radars; ++r) {
            const int load = counts[idx_radar_bandwidth(static_cast<RadarIndex>(r), gene.bandwidth)];
            if (load < best_load) {
                best_load = load;
                best = static_cast<RadarIndex>(r);
            }
        }

        --here;
        if (best) {
            gene.target = *best;
            ++counts[idx_radar_bandwidth(*best, gene.bandwidth)];
        } else {
            gene.target.reset();
        }
    }
    return trial;
}

double EpdeOptimizer::constraint_penalty(const AssignmentMatrix& matrix, const Scenario& scenario) const {
    const size_t n_radars = scenario.radars.size();

    int missing = 0;
    for (const auto& gene : matrix.genes) {
        if (gene.has_target() && *gene.target >= n_radars) ++missing;
    }

    int overrun = 0;
    const auto counts = count_radar_bandwidth(matrix, n_radars);
    for (size_t r = 0; r < n_radars; ++r) {
        for (size_t bw = 0; bw < kBandwidthCount; ++bw) {
            const auto mode = static_cast<BandwidthMode>(bw);
            const int excess = counts[idx_radar_bandwidth(static_cast<RadarIndex>(r), mode)] -
                               EffectivenessModel::max_targets(mode);
            if (excess > 0) overrun += excess;
        }
    }

    return cfg_.weights.missing_target * missing + cfg_.weights.capacity_overrun * overrun;
}

double EpdeOptimizer::evaluate_fitness(const AssignmentMatrix& matrix,
                                       const Scenario& scenario,
                                       const ewa::analysis::CombatAnalyzer& analyzer) const {
    const auto eval = analyzer.evaluate_assignment(matrix, scenario.radars, scenario.jammers);
    const double fitness = eval.total_effectiveness
                         + cfg_.weights.utilization * eval.resource_utilization
                         + cfg_.weights.interruption * eval.interruption_count
                         - constraint_penalty(matrix, scenario);
    return std::max(0.0, fitness);
}

OptimizeResult EpdeOptimizer::optimize(const Scenario& scenario,
                                       const ewa::analysis::CombatAnalyzer& analyzer) {
    const auto start = clock::now();
    Rng rng(cfg_.seed ? *cfg_.seed : std::random_device{}());

    state_ = OptimizerState::Running;

    LOG(INFO) << "ePDE start: population=" << cfg_.population_size
              << ", max_generations=" << cfg_.max_generations
              << ", time_limit=" << cfg_.time_limit_sec << "s"
              << ", radars=" << scenario.radars.size()
              << ", jammers=" << scenario.jammers.size();

    Population population = initialize_population(scenario, rng);
    std::vector<double> fitness(population.size());
    for (size_t i = 0; i < population.size(); ++i) {
        fitness[i] = evaluate_fitness(population[i], scenario, analyzer);
    }

    OptimizeResult result;
    const size_t first_best = static_cast<size_t>(
        std::max_element(fitness.begin(), fitness.end()) - fitness.begin());
    result.best_assignment = population[first_best];
    result.best_fitness = fitness[first_best];

    for (int gen = 0; gen < cfg_.max_generations; ++gen) {
        if (seconds_since(start) >= cfg_.time_limit_sec) {
            result.time_limit_hit = true;
            LOG(INFO) << "ePDE time limit reached, stopping at generation " << gen;
            break;
        }

        Population next(population.size());
        std::vector<double> next_fitness(population.size());

        // 各个体只读上一代种群，写入自己的槽位
        for (size_t i = 0; i < population.size(); ++i) {
            auto mutant = mutate(population, i, rng);
            auto trial = repair(crossover(population[i], mutant, rng), scenario, rng);
            const double trial_fitness = evaluate_fitness(trial, scenario, analyzer);

            if (trial_fitness > fitness[i]) {
                next[i] = std::move(trial);
                next_fitness[i] = trial_fitness;
            } else {
                next[i] = population[i];
                next_fitness[i] = fitness[i];
            }
        }

        // 历史最优：对各槽位结果做单调 max 归约
        const size_t slot = static_cast<size_t>(
            std::max_element(next_fitness.begin(), next_fitness.end()) - next_fitness.begin());
        if (next_fitness[slot] > result.best_fitness) {
            result.best_fitness = next_fitness[slot];
            result.best_assignment = next[slot];
        }

        ConvergenceRecord record;
        record.generation = gen;
        record.avg_fitness = std::accumulate(fitness.begin(), fitness.end(), 0.0) / fitness.size();
        record.max_fitness = *std::max_element(fitness.begin(), fitness.end());
        record.best_fitness = result.best_fitness;
        result.convergence.push_back(record);

        population = std::move(next);
        fitness = std::move(next_fitness);
        result.generations = gen + 1;

        if (observer_) observer_(record);
    }

    result.elapsed_sec = seconds_since(start);
    state_ = OptimizerState::Completed;

    LOG(INFO) << "ePDE done: generations=" << result.generations
              << ", elapsed=" << result.elapsed_sec << "s"
              << ", best_fitness=" << result.best_fitness;
    return result;
}

} // namespace ewa::optim
