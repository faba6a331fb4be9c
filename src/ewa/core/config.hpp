#pragma once
#include <cstdint>
#include <optional>

namespace ewa::config {

// 离散差分变异的概率常数
struct MutationConfig {
	double mutation_rate{0.8}; // 进入差分分支的概率
	double inherit_prob{0.5};  // 差分分支内直接继承 a 的概率
};

struct FitnessWeights {
	double utilization{0.5};      // 资源利用率奖励
	double interruption{0.3};     // 每部中断雷达的奖励
	double missing_target{1.0};   // 每个指向不存在雷达的基因
	double capacity_overrun{0.5}; // 每个带宽超额单位
};

struct EpdeConfig {
	int                     population_size{50};
	int                     max_generations{100};
	double                  crossover_rate{0.9};
	double                  scaling_factor{0.5};
	double                  time_limit_sec{1.0};
	MutationConfig          mutation{};
	FitnessWeights          weights{};
	std::optional<uint64_t> seed{};
};

struct AnalyzerConfig {
	bool   consider_illumination{true};
	double effective_range_m{50000.0};
	double neutral_factor{0.5};
};

struct SolveConfig {
	EpdeConfig     epde{};
	AnalyzerConfig analyzer{};
};

}// namespace ewa::config
