#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ewa::types {

using Id         = std::string;
using RadarId    = Id;
using JammerId   = Id;
using RadarIndex = uint32_t;

// 雷达作战阶段（探测-交战链路上的位置）
enum class RadarStage : uint8_t
{
	Search,
	Acquisition,
	Tracking,
	Guidance
};

// 干扰技术
enum class JammingTechnique : uint8_t
{
	NJ,   // 噪声干扰
	CP,   // 覆盖脉冲
	MFT,  // 多假目标
	RGPO, // 距离门拖引
	VGPO  // 速度门拖引
};

// 带宽模式：窄带/中带/宽带
enum class BandwidthMode : uint8_t
{
	Narrow,
	Medium,
	Wide
};

inline constexpr size_t kStageCount     = 4;
inline constexpr size_t kTechniqueCount = 5;
inline constexpr size_t kBandwidthCount = 3;

struct GeoPosition {
	double lat{0.0};
	double lon{0.0};
	double alt{0.0};
};

struct Radar {
	RadarId     id;
	std::string name;
	GeoPosition position{};
	double      frequency_ghz{0.0};
	double      power{0.0};
	RadarStage  current_stage{RadarStage::Search};
	double      interruption_threshold{0.3}; // 0-1
};

struct Jammer {
	JammerId    id;
	std::string name;
	GeoPosition position{};
	double      power{0.0};
};

struct Scenario {
	std::vector<Radar>  radars;
	std::vector<Jammer> jammers;
};

/**
 * 单个基因：一部干扰机的分配
 * target 为雷达在 Scenario::radars 中的下标，空表示不分配
 */
struct Assignment {
	std::optional<RadarIndex> target{};
	JammingTechnique          technique{JammingTechnique::NJ};
	BandwidthMode             bandwidth{BandwidthMode::Medium};

	bool has_target() const { return target.has_value(); }

	bool operator==(const Assignment& o) const
	{
		return target == o.target && technique == o.technique && bandwidth == o.bandwidth;
	}
	bool operator!=(const Assignment& o) const { return !(*this == o); }
};

/**
 * 分配矩阵（基因组）：下标 i 对应 Scenario::jammers[i]
 * 不变量：genes.size() == jammers.size()
 */
struct AssignmentMatrix {
	std::vector<Assignment> genes;

	size_t size() const { return genes.size(); }
	Assignment&       operator[](size_t i) { return genes[i]; }
	const Assignment& operator[](size_t i) const { return genes[i]; }

	bool operator==(const AssignmentMatrix& o) const { return genes == o.genes; }
	bool operator!=(const AssignmentMatrix& o) const { return !(*this == o); }
};

using Population = std::vector<AssignmentMatrix>;

struct ConvergenceRecord {
	int    generation{0};
	double avg_fitness{0.0};
	double max_fitness{0.0};
	double best_fitness{0.0};
};

using ConvergenceHistory = std::vector<ConvergenceRecord>;

inline size_t idx_stage_technique(RadarStage s, JammingTechnique t)
{
	return static_cast<size_t>(s) * kTechniqueCount + static_cast<size_t>(t);
}

// (雷达, 带宽) 计数表的行主序下标
inline size_t idx_radar_bandwidth(RadarIndex r, BandwidthMode bw)
{
	return static_cast<size_t>(r) * kBandwidthCount + static_cast<size_t>(bw);
}

}// namespace ewa::types
