/* -- C++ -- */
/**
 *  @file  data/include/DataFields.hh
 *
 *  @brief Names of the index and value fields a raw column can be mapped to.
 */

#ifndef EVE_DATA_DATA_FIELDS_H
#define EVE_DATA_DATA_FIELDS_H

namespace eve
{

inline constexpr const char *kPositionField = "position_counts";
inline constexpr const char *kMillisecondsField = "milliseconds";

inline constexpr const char *kDataField = "data";
inline constexpr const char *kAttemptsField = "attempts";
inline constexpr const char *kCountsField = "counts";
inline constexpr const char *kStdField = "std";
inline constexpr const char *kNormalizedField = "normalized_data";
inline constexpr const char *kNormalizingField = "normalizing_data";

} // namespace eve

#endif // EVE_DATA_DATA_FIELDS_H
