/**
 * @file vxs_error.h
 * @brief VoxStream Core - Structured streaming errors
 *
 * A StreamingError is what callbacks receive when a chunk could not be
 * synthesized or played. It pairs the result code with the pipeline stage
 * and the sequence number it applies to.
 */

#ifndef VOXSTREAM_CORE_ERROR_H
#define VOXSTREAM_CORE_ERROR_H

#include <cstdint>
#include <string>

#include "voxstream/core/vxs_types.h"

namespace voxstream {

enum class ErrorCategory : int {
    None = 0,
    Parser = 1,
    Synthesis = 2,
    Playback = 3,
    Control = 4,
    Config = 5,
};

const char* error_category_to_string(ErrorCategory category);

/** Default category for a result code, derived from its numeric range. */
ErrorCategory error_category_for(vxs_result_t code);

struct StreamingError {
    vxs_result_t code = VXS_SUCCESS;
    ErrorCategory category = ErrorCategory::None;
    std::string message;
    int64_t sequence_number = kNoSequence;

    // Attempts made before the error was reported (synthesis only)
    int32_t attempts = 0;

    bool ok() const { return code == VXS_SUCCESS; }
    bool is_cancellation() const { return code == VXS_ERROR_CANCELLED; }

    // Format: "[Synthesis] SYNTHESIS_TIMEOUT (seq 4): provider took 61000 ms"
    std::string to_string() const;
};

StreamingError make_error(vxs_result_t code, const std::string& message,
                          int64_t sequence_number = kNoSequence);

}  // namespace voxstream

#endif  // VOXSTREAM_CORE_ERROR_H
