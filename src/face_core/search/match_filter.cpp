#include "face_core/search/match_filter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace face_core {

namespace {

constexpr double PI = 3.14159265358979323846;

bool is_iso_date(const std::string &date) {
  if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
    return false;
  }
  for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (!std::isdigit(static_cast<unsigned char>(date[i]))) {
      return false;
    }
  }
  int month = std::stoi(date.substr(5, 2));
  int day = std::stoi(date.substr(8, 2));
  return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

void require_iso_date(const std::string &name, const std::string &value) {
  if (!is_iso_date(value)) {
    throw std::invalid_argument(name + " must be YYYY-MM-DD, got '" + value + "'");
  }
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

double to_radians(double degrees) {
  return degrees * PI / 180.0;
}

}  // namespace

double haversine_km(double lat1, double lon1, double lat2, double lon2) {
  const double dlat = to_radians(lat2 - lat1);
  const double dlon = to_radians(lon2 - lon1);
  const double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(to_radians(lat1)) * std::cos(to_radians(lat2)) *
                       std::sin(dlon / 2) * std::sin(dlon / 2);
  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return EARTH_RADIUS_KM * c;
}

std::optional<std::string> photo_date(const std::string &timestamp) {
  if (timestamp.size() < 10) {
    return std::nullopt;
  }
  // EXIF writes "YYYY:MM:DD HH:MM:SS"
  std::string date = timestamp.substr(0, 10);
  std::replace(date.begin(), date.end(), ':', '-');
  if (!is_iso_date(date)) {
    return std::nullopt;
  }
  return date;
}

std::vector<MatchGroup> apply_criteria(const std::vector<MatchGroup> &groups,
                                       const MatchCriteria &criteria) {
  if (criteria.date_start) {
    require_iso_date("date_start", *criteria.date_start);
  }
  if (criteria.date_end) {
    require_iso_date("date_end", *criteria.date_end);
  }
  if (criteria.near && !(criteria.near->radius_km >= 0.0)) {
    throw std::invalid_argument("radius_km must be non-negative");
  }
  if (criteria.empty()) {
    return groups;
  }

  const std::optional<std::string> location_needle =
      criteria.location_name ? std::optional<std::string>(to_lower(*criteria.location_name))
                             : std::nullopt;

  std::vector<MatchGroup> kept;
  for (const auto &group : groups) {
    const FaceMetadata &metadata = group.metadata;

    if (location_needle) {
      if (!metadata.location_name ||
          to_lower(*metadata.location_name).find(*location_needle) == std::string::npos) {
        continue;
      }
    }

    if (criteria.date_start || criteria.date_end) {
      std::optional<std::string> date =
          metadata.timestamp ? photo_date(*metadata.timestamp) : std::nullopt;
      if (!date) {
        continue;
      }
      // Fixed-width ISO dates compare lexicographically.
      if (criteria.date_start && *date < *criteria.date_start) {
        continue;
      }
      if (criteria.date_end && *date > *criteria.date_end) {
        continue;
      }
    }

    if (criteria.near) {
      if (!metadata.has_coordinates()) {
        continue;
      }
      double distance = haversine_km(criteria.near->latitude, criteria.near->longitude,
                                     *metadata.latitude, *metadata.longitude);
      if (distance > criteria.near->radius_km) {
        continue;
      }
    }

    kept.push_back(group);
  }
  return kept;
}

}  // namespace face_core
