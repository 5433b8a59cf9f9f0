/**
 * @file vxs_audio_utils.h
 * @brief VoxStream Core - WAV encoding helpers
 *
 * Segments are opaque bytes to the pipeline; these helpers exist for the
 * providers and sinks that produce or consume 16-bit mono PCM WAV.
 */

#ifndef VOXSTREAM_CORE_AUDIO_UTILS_H
#define VOXSTREAM_CORE_AUDIO_UTILS_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "voxstream/core/vxs_types.h"

namespace voxstream {

constexpr size_t kWavHeaderSize = 44;

struct WavInfo {
    int32_t sample_rate = 0;
    uint16_t channels = 0;
    uint16_t bits_per_sample = 0;
    size_t data_offset = 0;
    size_t data_size = 0;

    double duration_ms() const;
};

/**
 * @brief Wrap Int16 mono PCM samples in a WAV container.
 * @return VXS_ERROR_INVALID_ARGUMENT for empty input or a bad sample rate
 */
vxs_result_t int16_to_wav(const std::vector<int16_t>& samples, int32_t sample_rate,
                          std::vector<uint8_t>& wav_out);

/**
 * @brief Read the header of a canonical 44-byte-header PCM WAV.
 * @return VXS_ERROR_INVALID_ARGUMENT when the bytes are not such a file
 */
vxs_result_t parse_wav_header(const std::vector<uint8_t>& wav, WavInfo& info);

}  // namespace voxstream

#endif  // VOXSTREAM_CORE_AUDIO_UTILS_H
