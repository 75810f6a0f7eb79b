/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <map>
#include <utility>
#include <vector>

#include "TrajectoryReducer.hpp"

namespace trk_guess {

ReducedTracks reduce(const std::vector<PositionSample> &samples)
{
    // index of first/last sample per flight; std::map keeps keys ordered
    std::map<FlightKey, std::pair<size_t, size_t>> extremes;

    for (size_t i = 0; i < samples.size(); ++i) {
        const auto &sample = samples[i];
        auto it = extremes.find(sample.key);
        if (it == extremes.end()) {
            extremes.emplace(sample.key, std::make_pair(i, i));
            continue;
        }

        auto &[firstIdx, lastIdx] = it->second;
        if (sample.timestamp < samples[firstIdx].timestamp) {
            firstIdx = i;
        }
        if (sample.timestamp >= samples[lastIdx].timestamp) {
            lastIdx = i;
        }
    }

    ReducedTracks reduced;
    reduced.first.reserve(extremes.size());
    reduced.last.reserve(extremes.size());
    for (const auto &entry : extremes) {
        reduced.first.push_back(samples[entry.second.first]);
        reduced.last.push_back(samples[entry.second.second]);
    }
    return reduced;
}

} // namespace trk_guess
