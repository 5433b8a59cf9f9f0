/**
 * @file vxs_error.cpp
 * @brief VoxStream Core - Result code names and structured errors
 */

#include "voxstream/core/vxs_error.h"

#include <cstdio>

namespace voxstream {

const char* vxs_result_to_string(vxs_result_t result) {
    switch (result) {
        case VXS_SUCCESS:
            return "SUCCESS";
        case VXS_ERROR_NULL_POINTER:
            return "NULL_POINTER";
        case VXS_ERROR_INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case VXS_ERROR_INVALID_STATE:
            return "INVALID_STATE";
        case VXS_ERROR_INVALID_CONFIG:
            return "INVALID_CONFIG";
        case VXS_ERROR_NOT_RUNNING:
            return "NOT_RUNNING";
        case VXS_ERROR_FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case VXS_ERROR_PARSE_BUFFER_OVERFLOW:
            return "PARSE_BUFFER_OVERFLOW";
        case VXS_ERROR_SYNTHESIS_TIMEOUT:
            return "SYNTHESIS_TIMEOUT";
        case VXS_ERROR_SYNTHESIS_PROVIDER:
            return "SYNTHESIS_PROVIDER_ERROR";
        case VXS_ERROR_INVALID_SEQUENCE:
            return "INVALID_SEQUENCE";
        case VXS_ERROR_PLAYBACK_SINK:
            return "PLAYBACK_SINK_ERROR";
        case VXS_ERROR_CANCELLED:
            return "CANCELLED";
        default:
            return "UNKNOWN_ERROR";
    }
}

const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:
            return "None";
        case ErrorCategory::Parser:
            return "Parser";
        case ErrorCategory::Synthesis:
            return "Synthesis";
        case ErrorCategory::Playback:
            return "Playback";
        case ErrorCategory::Control:
            return "Control";
        case ErrorCategory::Config:
            return "Config";
        default:
            return "Unknown";
    }
}

ErrorCategory error_category_for(vxs_result_t code) {
    if (code == VXS_SUCCESS) return ErrorCategory::None;
    if (code == VXS_ERROR_INVALID_CONFIG) return ErrorCategory::Config;
    if (code <= -200 && code > -300) return ErrorCategory::Parser;
    if (code <= -300 && code > -400) return ErrorCategory::Synthesis;
    if (code <= -400 && code > -500) return ErrorCategory::Playback;
    return ErrorCategory::Control;
}

std::string StreamingError::to_string() const {
    char buffer[64];
    std::string out = "[";
    out += error_category_to_string(category);
    out += "] ";
    out += vxs_result_to_string(code);
    if (sequence_number != kNoSequence) {
        snprintf(buffer, sizeof(buffer), " (seq %lld)", static_cast<long long>(sequence_number));
        out += buffer;
    }
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

StreamingError make_error(vxs_result_t code, const std::string& message,
                          int64_t sequence_number) {
    StreamingError error;
    error.code = code;
    error.category = error_category_for(code);
    error.message = message;
    error.sequence_number = sequence_number;
    return error;
}

}  // namespace voxstream
