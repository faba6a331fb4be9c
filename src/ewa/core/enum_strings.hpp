#pragma once
#include "types.hpp"

namespace ewa::types {

inline const char* to_string(RadarStage stage) {
    switch (stage) {
        case RadarStage::Search:      return "search";
        case RadarStage::Acquisition: return "acquisition";
        case RadarStage::Tracking:    return "tracking";
        case RadarStage::Guidance:    return "guidance";
    }
    return "unknown";
}

inline const char* to_string(JammingTechnique t) {
    switch (t) {
        case JammingTechnique::NJ:   return "NJ";
        case JammingTechnique::CP:   return "CP";
        case JammingTechnique::MFT:  return "MFT";
        case JammingTechnique::RGPO: return "RGPO";
        case JammingTechnique::VGPO: return "VGPO";
    }
    return "unknown";
}

// 带宽类型沿用 N/M/W 单字母缩写
inline const char* to_string(BandwidthMode bw) {
    switch (bw) {
        case BandwidthMode::Narrow: return "N";
        case BandwidthMode::Medium: return "M";
        case BandwidthMode::Wide:   return "W";
    }
    return "unknown";
}

} // namespace ewa::types
