/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Position samples and the endpoints derived from them.
 *
 */

#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace trk_guess {

/**
 * Whether a batch distinguishes flights by date as well as callsign.
 * Resolved once per batch; in WithoutDate mode every FlightKey::date is
 * empty, so grouping and joining never branch per row.
 */
enum class DateMode { WithoutDate, WithDate };

struct FlightKey {
    std::string callsign;
    std::string date; // YYYYMMDD, empty in WithoutDate batches

    bool operator<(const FlightKey &other) const
    {
        return std::tie(callsign, date) < std::tie(other.callsign, other.date);
    }
    bool operator==(const FlightKey &other) const { return callsign == other.callsign && date == other.date; }
    bool operator!=(const FlightKey &other) const { return !(*this == other); }
};

struct PositionSample {
    FlightKey key;
    std::string time;      // as read, echoed back on annotated output
    double timestamp{0.0}; // seconds, used for ordering
    double latitudeDeg{0.0};
    double longitudeDeg{0.0};
    int altitudeFt{0};
    std::string category;
};

class TrackBatch
{
  public:
    explicit TrackBatch(DateMode mode = DateMode::WithoutDate) : m_mode(mode) {}

    [[nodiscard]] DateMode mode() const { return m_mode; }
    [[nodiscard]] bool hasDate() const { return m_mode == DateMode::WithDate; }

    /// Append one source's samples. Dates are cleared in WithoutDate batches.
    void append(std::vector<PositionSample> samples)
    {
        m_samples.reserve(m_samples.size() + samples.size());
        for (auto &sample : samples) {
            if (m_mode == DateMode::WithoutDate) {
                sample.key.date.clear();
            }
            m_samples.push_back(std::move(sample));
        }
    }

    [[nodiscard]] const std::vector<PositionSample> &samples() const { return m_samples; }
    [[nodiscard]] size_t size() const { return m_samples.size(); }
    [[nodiscard]] bool empty() const { return m_samples.empty(); }

  private:
    DateMode m_mode;
    std::vector<PositionSample> m_samples;
};

enum class Boundary { Entry, Exit };

/**
 * @brief First or last observed position of a flight.
 *
 * assignedLocation starts unset and is written at most once.
 */
struct Endpoint {
    FlightKey key;
    Boundary boundary{Boundary::Entry};
    double latitudeDeg{0.0};
    double longitudeDeg{0.0};
    int altitudeFt{0};
    std::optional<std::string> assignedLocation;
    std::optional<double> distanceKm;

    [[nodiscard]] bool isAssigned() const { return assignedLocation.has_value(); }
};

using EndpointTable = std::vector<Endpoint>;

} // namespace trk_guess
