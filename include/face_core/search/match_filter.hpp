#pragma once

#include <optional>
#include <string>
#include <vector>

#include "face_core/search/match_aggregator.hpp"

namespace face_core {

constexpr double EARTH_RADIUS_KM = 6371.0;

struct GeoRadius {
  double latitude = 0.0;
  double longitude = 0.0;
  double radius_km = 0.0;
};

// Every set field must hold for a group to be kept.
struct MatchCriteria {
  // Case-insensitive substring of the photo's location name
  std::optional<std::string> location_name;
  // Inclusive "YYYY-MM-DD" bounds
  std::optional<std::string> date_start;
  std::optional<std::string> date_end;
  std::optional<GeoRadius> near;

  bool empty() const {
    return !location_name && !date_start && !date_end && !near;
  }
};

double haversine_km(double lat1, double lon1, double lat2, double lon2);

// "YYYY-MM-DD" from an EXIF or ISO timestamp, or nullopt when unparseable.
std::optional<std::string> photo_date(const std::string &timestamp);

/**
 * @brief Keeps the groups whose metadata satisfies the criteria.
 *
 * Input order is preserved. A group missing the field a filter needs is
 * excluded.
 *
 * @throws std::invalid_argument if a date bound is not "YYYY-MM-DD" or a radius is negative.
 */
std::vector<MatchGroup> apply_criteria(const std::vector<MatchGroup> &groups,
                                       const MatchCriteria &criteria);

}  // namespace face_core
