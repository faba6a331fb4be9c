#include <gtest/gtest.h>
#include <algorithm>
#include "../src/ewa/optim/epde_optimizer.hpp"
#include "../src/ewa/model/effectiveness_model.hpp"

using namespace ewa::types;
using ewa::analysis::CombatAnalyzer;
using ewa::config::EpdeConfig;
using ewa::model::EffectivenessModel;
using ewa::optim::EpdeOptimizer;
using ewa::optim::OptimizerState;
using ewa::optim::Rng;

class EpdeOptimizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const RadarStage stages[] = {RadarStage::Search, RadarStage::Acquisition,
                                     RadarStage::Tracking, RadarStage::Guidance};
        for (int i = 0; i < 4; ++i) {
            Radar r;
            r.id = "R" + std::to_string(i + 1);
            r.name = r.id;
            r.position = {30.0 + 0.05 * i, 120.0, 0.0};
            r.power = 100.0;
            r.current_stage = stages[i];
            scenario_.radars.push_back(r);
        }
        for (int i = 0; i < 6; ++i) {
            Jammer j;
            j.id = "J" + std::to_string(i + 1);
            j.name = j.id;
            j.position = {30.0, 120.0 + 0.05 * i, 0.0};
            j.power = 500.0 + 100.0 * i;
            scenario_.jammers.push_back(j);
        }
    }

    // 固定种子、不受时间限制
    static EpdeConfig seeded(uint64_t seed, int generations = 30) {
        EpdeConfig cfg;
        cfg.population_size = 20;
        cfg.max_generations = generations;
        cfg.time_limit_sec = 1e9;
        cfg.seed = seed;
        return cfg;
    }

    static void expect_capacity(const AssignmentMatrix& m, size_t n_radars) {
        const auto counts = ewa::optim::count_radar_bandwidth(m, n_radars);
        for (size_t r = 0; r < n_radars; ++r) {
            for (size_t bw = 0; bw < kBandwidthCount; ++bw) {
                const auto mode = static_cast<BandwidthMode>(bw);
                EXPECT_LE(counts[idx_radar_bandwidth(static_cast<RadarIndex>(r), mode)],
                          EffectivenessModel::max_targets(mode));
            }
        }
    }

    Scenario scenario_;
    CombatAnalyzer analyzer_;
};

TEST_F(EpdeOptimizerTest, ResultIsCompleteAndFeasible) {
    EpdeOptimizer opt(seeded(1));
    auto result = opt.optimize(scenario_, analyzer_);

    ASSERT_EQ(result.best_assignment.size(), scenario_.jammers.size());
    for (const auto& gene : result.best_assignment.genes) {
        if (gene.has_target()) {
            EXPECT_LT(*gene.target, scenario_.radars.size());
        }
    }
    expect_capacity(result.best_assignment, scenario_.radars.size());
    EXPECT_GE(result.best_fitness, 0.0);
    EXPECT_EQ(opt.state(), OptimizerState::Completed);
}

TEST_F(EpdeOptimizerTest, BestFitnessMonotone) {
    EpdeOptimizer opt(seeded(7, 50));
    auto result = opt.optimize(scenario_, analyzer_);

    ASSERT_EQ(result.convergence.size(), 50u);
    for (size_t i = 1; i < result.convergence.size(); ++i) {
        EXPECT_GE(result.convergence[i].best_fitness, result.convergence[i - 1].best_fitness);
        EXPECT_EQ(result.convergence[i].generation, static_cast<int>(i));
    }
    for (const auto& rec : result.convergence) {
        EXPECT_LE(rec.avg_fitness, rec.max_fitness + 1e-12);
        EXPECT_LE(rec.max_fitness, rec.best_fitness + 1e-12);
    }
    EXPECT_DOUBLE_EQ(result.best_fitness, result.convergence.back().best_fitness);
    EXPECT_NEAR(opt.evaluate_fitness(result.best_assignment, scenario_, analyzer_), result.best_fitness, 1e-12);
}

TEST_F(EpdeOptimizerTest, DeterministicWithSeed) {
    EpdeOptimizer a(seeded(42));
    EpdeOptimizer b(seeded(42));
    auto ra = a.optimize(scenario_, analyzer_);
    auto rb = b.optimize(scenario_, analyzer_);

    EXPECT_EQ(ra.best_assignment, rb.best_assignment);
    EXPECT_DOUBLE_EQ(ra.best_fitness, rb.best_fitness);
    ASSERT_EQ(ra.convergence.size(), rb.convergence.size());
    for (size_t i = 0; i < ra.convergence.size(); ++i) {
        EXPECT_EQ(ra.convergence[i].generation, rb.convergence[i].generation);
        EXPECT_DOUBLE_EQ(ra.convergence[i].avg_fitness, rb.convergence[i].avg_fitness);
        EXPECT_DOUBLE_EQ(ra.convergence[i].max_fitness, rb.convergence[i].max_fitness);
        EXPECT_DOUBLE_EQ(ra.convergence[i].best_fitness, rb.convergence[i].best_fitness);
    }
}

TEST_F(EpdeOptimizerTest, ZeroTimeLimitKeepsInitialBest) {
    EpdeConfig cfg = seeded(3);
    cfg.time_limit_sec = 0.0;
    EpdeOptimizer opt(cfg);
    auto result = opt.optimize(scenario_, analyzer_);

    EXPECT_TRUE(result.convergence.empty());
    EXPECT_EQ(result.generations, 0);
    EXPECT_TRUE(result.time_limit_hit);
    EXPECT_EQ(result.best_assignment.size(), scenario_.jammers.size());
    EXPECT_GE(result.best_fitness, 0.0);
}

TEST_F(EpdeOptimizerTest, EmptyScenario) {
    EpdeOptimizer opt(seeded(5, 5));
    auto result = opt.optimize(Scenario{}, analyzer_);
    EXPECT_EQ(result.best_assignment.size(), 0u);
    EXPECT_DOUBLE_EQ(result.best_fitness, 0.0);
}

TEST_F(EpdeOptimizerTest, NoRadarsLeavesJammersUnassigned) {
    Scenario s;
    s.jammers = scenario_.jammers;
    EpdeOptimizer opt(seeded(5, 5));
    auto result = opt.optimize(s, analyzer_);
    ASSERT_EQ(result.best_assignment.size(), s.jammers.size());
    for (const auto& gene : result.best_assignment.genes) {
        EXPECT_FALSE(gene.has_target());
    }
    EXPECT_DOUBLE_EQ(result.best_fitness, 0.0);
}

TEST_F(EpdeOptimizerTest, SmallScenarioFinishesInTime) {
    Scenario s;
    s.radars.assign(scenario_.radars.begin(), scenario_.radars.begin() + 2);
    s.jammers.assign(scenario_.jammers.begin(), scenario_.jammers.begin() + 3);

    EpdeOptimizer opt;  // 默认配置，1 秒预算
    auto result = opt.optimize(s, analyzer_);
    EXPECT_LT(result.elapsed_sec, 1.5);
    EXPECT_EQ(result.best_assignment.size(), 3u);
    EXPECT_GT(result.best_fitness, 0.0);
}

// 搜索雷达 + 跟踪雷达、3 部干扰机，种群 10、20 代、1 秒预算
TEST_F(EpdeOptimizerTest, SearchAndTrackingScenario) {
    Scenario s;
    s.radars = {scenario_.radars[0], scenario_.radars[2]};
    s.radars[0].id = "R1";
    s.radars[1].id = "R2";
    ASSERT_EQ(s.radars[0].current_stage, RadarStage::Search);
    ASSERT_EQ(s.radars[1].current_stage, RadarStage::Tracking);
    s.jammers.assign(scenario_.jammers.begin(), scenario_.jammers.begin() + 3);

    for (uint64_t seed = 1; seed <= 20; ++seed) {
        EpdeConfig cfg;
        cfg.population_size = 10;
        cfg.max_generations = 20;
        cfg.time_limit_sec = 1.0;
        cfg.seed = seed;
        EpdeOptimizer opt(cfg);

        // 与 optimize() 相同的种子得到相同的初始种群
        Rng rng(seed);
        double initial_best = 0.0;
        for (const auto& ind : opt.initialize_population(s, rng)) {
            initial_best = std::max(initial_best, opt.evaluate_fitness(ind, s, analyzer_));
        }

        auto result = opt.optimize(s, analyzer_);
        EXPECT_LT(result.elapsed_sec, 1.5);
        EXPECT_GE(result.best_fitness, initial_best);
        ASSERT_EQ(result.best_assignment.size(), 3u);
        if (!result.convergence.empty()) {
            EXPECT_DOUBLE_EQ(result.convergence.front().max_fitness, initial_best);
        }

        const auto eval = analyzer_.evaluate_assignment(result.best_assignment, s.radars, s.jammers);
        EXPECT_GE(eval.resource_utilization, 0.0);
        EXPECT_LE(eval.resource_utilization, 1.0);
    }
}

TEST_F(EpdeOptimizerTest, ObserverCalledEachGeneration) {
    EpdeOptimizer opt(seeded(9, 12));
    int calls = 0;
    int last_generation = -1;
    opt.set_progress_observer([&](const ConvergenceRecord& rec) {
        ++calls;
        last_generation = rec.generation;
    });
    auto result = opt.optimize(scenario_, analyzer_);
    EXPECT_EQ(calls, result.generations);
    EXPECT_EQ(last_generation, 11);
}

// ==================== 算子 ====================

TEST_F(EpdeOptimizerTest, InitializePopulationShape) {
    EpdeOptimizer opt(seeded(11));
    Rng rng(11);
    auto pop = opt.initialize_population(scenario_, rng);
    ASSERT_EQ(pop.size(), 20u);
    for (const auto& ind : pop) {
        ASSERT_EQ(ind.size(), scenario_.jammers.size());
        for (const auto& gene : ind.genes) {
            ASSERT_TRUE(gene.has_target());
            EXPECT_LT(*gene.target, scenario_.radars.size());
        }
    }
}

TEST_F(EpdeOptimizerTest, MutateAndCrossoverPreserveLength) {
    EpdeOptimizer opt(seeded(13));
    Rng rng(13);
    auto pop = opt.initialize_population(scenario_, rng);
    for (size_t i = 0; i < pop.size(); ++i) {
        auto mutant = opt.mutate(pop, i, rng);
        EXPECT_EQ(mutant.size(), scenario_.jammers.size());
        auto trial = opt.crossover(pop[i], mutant, rng);
        EXPECT_EQ(trial.size(), scenario_.jammers.size());
    }
}

TEST_F(EpdeOptimizerTest, MutateWithSingleIndividual) {
    EpdeConfig cfg = seeded(17);
    cfg.population_size = 1;
    EpdeOptimizer opt(cfg);
    Rng rng(17);
    auto pop = opt.initialize_population(scenario_, rng);
    ASSERT_EQ(pop.size(), 1u);
    // 没有其他个体可选时只能从自身继承
    EXPECT_EQ(opt.mutate(pop, 0, rng), pop[0]);
}

TEST_F(EpdeOptimizerTest, CrossoverRateBounds) {
    AssignmentMatrix target;
    AssignmentMatrix mutant;
    for (size_t j = 0; j < scenario_.jammers.size(); ++j) {
        target.genes.push_back(Assignment{RadarIndex{0}, JammingTechnique::NJ, BandwidthMode::Wide});
        mutant.genes.push_back(Assignment{RadarIndex{1}, JammingTechnique::CP, BandwidthMode::Medium});
    }
    Rng rng(19);

    EpdeConfig all = seeded(19);
    all.crossover_rate = 1.0;
    EXPECT_EQ(EpdeOptimizer(all).crossover(target, mutant, rng), mutant);

    EpdeConfig none = seeded(19);
    none.crossover_rate = 0.0;
    EXPECT_EQ(EpdeOptimizer(none).crossover(target, mutant, rng), target);
}

TEST_F(EpdeOptimizerTest, RepairFixesDanglingTargets) {
    EpdeOptimizer opt(seeded(23));
    Rng rng(23);
    AssignmentMatrix trial;
    trial.genes.push_back(Assignment{RadarIndex{99}, JammingTechnique::NJ, BandwidthMode::Wide});
    trial.genes.push_back(Assignment{});

    auto repaired = opt.repair(trial, scenario_, rng);
    ASSERT_EQ(repaired.size(), scenario_.jammers.size());
    ASSERT_TRUE(repaired[0].has_target());
    EXPECT_LT(*repaired[0].target, scenario_.radars.size());
    EXPECT_FALSE(repaired[1].has_target());
}

TEST_F(EpdeOptimizerTest, RepairEnforcesBandwidthCapacity) {
    EpdeOptimizer opt(seeded(29));
    Rng rng(29);

    // 6 部窄带全部指向雷达 0：4 部雷达各能容纳 1 部
    AssignmentMatrix trial;
    for (size_t j = 0; j < scenario_.jammers.size(); ++j) {
        trial.genes.push_back(Assignment{RadarIndex{0}, JammingTechnique::CP, BandwidthMode::Narrow});
    }
    auto repaired = opt.repair(trial, scenario_, rng);
    expect_capacity(repaired, scenario_.radars.size());

    int assigned = 0;
    for (const auto& gene : repaired.genes) {
        if (gene.has_target()) ++assigned;
    }
    EXPECT_EQ(assigned, 4);
    EXPECT_DOUBLE_EQ(opt.constraint_penalty(repaired, scenario_), 0.0);
}

TEST_F(EpdeOptimizerTest, ConstraintPenalty) {
    EpdeOptimizer opt(seeded(31));
    AssignmentMatrix m;
    m.genes = {
        Assignment{RadarIndex{0}, JammingTechnique::NJ, BandwidthMode::Narrow},
        Assignment{RadarIndex{0}, JammingTechnique::CP, BandwidthMode::Narrow},
        Assignment{RadarIndex{42}, JammingTechnique::MFT, BandwidthMode::Medium},
    };
    // 1 个悬空目标 × 1.0 + 1 个超额 × 0.5
    EXPECT_DOUBLE_EQ(opt.constraint_penalty(m, scenario_), 1.5);
}

TEST_F(EpdeOptimizerTest, FitnessNeverNegative) {
    EpdeOptimizer opt(seeded(37));
    AssignmentMatrix m;
    for (size_t j = 0; j < scenario_.jammers.size(); ++j) {
        m.genes.push_back(Assignment{RadarIndex{500}, JammingTechnique::NJ, BandwidthMode::Narrow});
    }
    EXPECT_DOUBLE_EQ(opt.evaluate_fitness(m, scenario_, analyzer_), 0.0);
}

TEST_F(EpdeOptimizerTest, InvalidConfigIsClamped) {
    EpdeConfig cfg;
    cfg.population_size = 0;
    cfg.max_generations = -3;
    cfg.crossover_rate = 1.7;
    cfg.time_limit_sec = -1.0;
    EpdeOptimizer opt(cfg);
    EXPECT_EQ(opt.config().population_size, 1);
    EXPECT_EQ(opt.config().max_generations, 0);
    EXPECT_DOUBLE_EQ(opt.config().crossover_rate, 1.0);
    EXPECT_DOUBLE_EQ(opt.config().time_limit_sec, 0.0);
}
