/**
 * @file vxs_audio_utils.cpp
 * @brief VoxStream Core - WAV encoding helpers
 */

#include "voxstream/core/vxs_audio_utils.h"

#include <cstring>

namespace voxstream {

namespace {

constexpr uint16_t kWavFormatPcm = 1;
constexpr uint16_t kWavChannelsMono = 1;
constexpr uint16_t kWavBitsPerSample16 = 16;

void write_uint16_le(uint8_t* buffer, uint16_t value) {
    buffer[0] = static_cast<uint8_t>(value & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void write_uint32_le(uint8_t* buffer, uint32_t value) {
    buffer[0] = static_cast<uint8_t>(value & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buffer[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

uint16_t read_uint16_le(const uint8_t* buffer) {
    return static_cast<uint16_t>(buffer[0] | (buffer[1] << 8));
}

uint32_t read_uint32_le(const uint8_t* buffer) {
    return static_cast<uint32_t>(buffer[0]) | (static_cast<uint32_t>(buffer[1]) << 8) |
           (static_cast<uint32_t>(buffer[2]) << 16) | (static_cast<uint32_t>(buffer[3]) << 24);
}

}  // namespace

double WavInfo::duration_ms() const {
    if (sample_rate <= 0 || channels == 0 || bits_per_sample == 0) {
        return 0.0;
    }
    size_t bytes_per_frame = static_cast<size_t>(channels) * (bits_per_sample / 8);
    if (bytes_per_frame == 0) {
        return 0.0;
    }
    double frames = static_cast<double>(data_size / bytes_per_frame);
    return frames * 1000.0 / static_cast<double>(sample_rate);
}

vxs_result_t int16_to_wav(const std::vector<int16_t>& samples, int32_t sample_rate,
                          std::vector<uint8_t>& wav_out) {
    if (samples.empty() || sample_rate <= 0) {
        return VXS_ERROR_INVALID_ARGUMENT;
    }
    if (samples.size() > (UINT32_MAX - kWavHeaderSize) / sizeof(int16_t)) {
        return VXS_ERROR_INVALID_ARGUMENT;
    }
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    wav_out.assign(kWavHeaderSize + data_size, 0);
    uint8_t* header = wav_out.data();

    std::memcpy(&header[0], "RIFF", 4);
    write_uint32_le(&header[4], data_size + kWavHeaderSize - 8);
    std::memcpy(&header[8], "WAVE", 4);

    std::memcpy(&header[12], "fmt ", 4);
    write_uint32_le(&header[16], 16);
    write_uint16_le(&header[20], kWavFormatPcm);
    write_uint16_le(&header[22], kWavChannelsMono);
    write_uint32_le(&header[24], static_cast<uint32_t>(sample_rate));
    write_uint32_le(&header[28], static_cast<uint32_t>(sample_rate) * kWavChannelsMono *
                                     (kWavBitsPerSample16 / 8));
    write_uint16_le(&header[32], kWavChannelsMono * (kWavBitsPerSample16 / 8));
    write_uint16_le(&header[34], kWavBitsPerSample16);

    std::memcpy(&header[36], "data", 4);
    write_uint32_le(&header[40], data_size);

    // Samples are stored little-endian
    uint8_t* data = header + kWavHeaderSize;
    for (size_t i = 0; i < samples.size(); ++i) {
        write_uint16_le(&data[i * 2], static_cast<uint16_t>(samples[i]));
    }
    return VXS_SUCCESS;
}

vxs_result_t parse_wav_header(const std::vector<uint8_t>& wav, WavInfo& info) {
    if (wav.size() < kWavHeaderSize) {
        return VXS_ERROR_INVALID_ARGUMENT;
    }
    const uint8_t* header = wav.data();
    if (std::memcmp(&header[0], "RIFF", 4) != 0 || std::memcmp(&header[8], "WAVE", 4) != 0 ||
        std::memcmp(&header[12], "fmt ", 4) != 0 || std::memcmp(&header[36], "data", 4) != 0) {
        return VXS_ERROR_INVALID_ARGUMENT;
    }
    if (read_uint16_le(&header[20]) != kWavFormatPcm) {
        return VXS_ERROR_INVALID_ARGUMENT;
    }

    info.channels = read_uint16_le(&header[22]);
    info.sample_rate = static_cast<int32_t>(read_uint32_le(&header[24]));
    info.bits_per_sample = read_uint16_le(&header[34]);
    info.data_offset = kWavHeaderSize;
    info.data_size = read_uint32_le(&header[40]);

    if (info.data_size > wav.size() - kWavHeaderSize) {
        info.data_size = wav.size() - kWavHeaderSize;
    }
    return VXS_SUCCESS;
}

}  // namespace voxstream
