#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace CKW {

using TimePoint = std::chrono::system_clock::time_point;

// EN: Timestamp helpers shared by the persisted formats (RFC 3339, microsecond precision).
// FR: Utilitaires d'horodatage partagés par les formats persistés (RFC 3339, précision microseconde).
namespace TimeUtils {

// EN: Format as "YYYY-MM-DDTHH:MM:SS.ffffffZ" in UTC.
// FR: Formate en "YYYY-MM-DDTHH:MM:SS.ffffffZ" en UTC.
std::string toRfc3339(const TimePoint& tp);

// EN: Parse RFC 3339 with optional fractional seconds (any precision) and "Z" or "+hh:mm" offset.
// FR: Analyse RFC 3339 avec fractions optionnelles (toute précision) et décalage "Z" ou "+hh:mm".
std::optional<TimePoint> fromRfc3339(const std::string& text);

std::int64_t toUnixMicros(const TimePoint& tp);
TimePoint fromUnixMicros(std::int64_t micros);

// EN: Truncate to the precision kept by the persisted formats.
// FR: Tronque à la précision conservée par les formats persistés.
TimePoint truncateToMicros(const TimePoint& tp);

} // namespace TimeUtils
} // namespace CKW
