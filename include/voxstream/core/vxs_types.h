/**
 * @file vxs_types.h
 * @brief VoxStream Core - Result codes and shared primitive types
 *
 * Every fallible operation in VoxStream returns a vxs_result_t. Zero is
 * success; errors are negative and grouped by pipeline stage.
 */

#ifndef VOXSTREAM_CORE_TYPES_H
#define VOXSTREAM_CORE_TYPES_H

#include <cstdint>

typedef int32_t vxs_result_t;

#define VXS_SUCCESS ((vxs_result_t)0)

// =============================================================================
// GENERIC ERRORS (-100 to -199)
// =============================================================================

#define VXS_ERROR_NULL_POINTER ((vxs_result_t)-100)
#define VXS_ERROR_INVALID_ARGUMENT ((vxs_result_t)-101)
#define VXS_ERROR_INVALID_STATE ((vxs_result_t)-102)
#define VXS_ERROR_INVALID_CONFIG ((vxs_result_t)-103)
#define VXS_ERROR_NOT_RUNNING ((vxs_result_t)-104)
#define VXS_ERROR_FILE_NOT_FOUND ((vxs_result_t)-105)

// =============================================================================
// PARSER ERRORS (-200 to -299)
// =============================================================================

#define VXS_ERROR_PARSE_BUFFER_OVERFLOW ((vxs_result_t)-200)

// =============================================================================
// SYNTHESIS ERRORS (-300 to -399)
// =============================================================================

#define VXS_ERROR_SYNTHESIS_TIMEOUT ((vxs_result_t)-300)
#define VXS_ERROR_SYNTHESIS_PROVIDER ((vxs_result_t)-301)
#define VXS_ERROR_INVALID_SEQUENCE ((vxs_result_t)-302)

// =============================================================================
// PLAYBACK ERRORS (-400 to -499)
// =============================================================================

#define VXS_ERROR_PLAYBACK_SINK ((vxs_result_t)-400)

// =============================================================================
// CONTROL SIGNALS (-900 to -999)
// =============================================================================

/** Not a failure: the work item was dropped by a cancellation request. */
#define VXS_ERROR_CANCELLED ((vxs_result_t)-900)

#define VXS_SUCCEEDED(result) ((result) >= 0)
#define VXS_FAILED(result) ((result) < 0)

namespace voxstream {

/**
 * @brief Human-readable name for a result code.
 *
 * Never returns nullptr; unknown codes map to "UNKNOWN_ERROR".
 */
const char* vxs_result_to_string(vxs_result_t result);

/** Sentinel for "no sequence number assigned yet". */
constexpr int64_t kNoSequence = -1;

}  // namespace voxstream

#endif  // VOXSTREAM_CORE_TYPES_H
