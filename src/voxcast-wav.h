#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

static constexpr size_t   k_voxcast_wav_header_bytes   = 44;
static constexpr uint32_t k_voxcast_wav_unknown_size   = 0xFFFFFFFFu;
static constexpr uint32_t k_voxcast_wav_min_sample_rate = 1000;
static constexpr uint32_t k_voxcast_wav_max_sample_rate = 384000;

struct voxcast_wav_format {
    uint32_t sample_rate     = 24000;
    uint16_t channels        = 1;
    uint16_t bits_per_sample = 16;
};

// Writes a canonical 44-byte RIFF/WAVE/PCM header into `p`.
void voxcast_wav_write_header(uint8_t * p, const voxcast_wav_format & fmt, uint32_t riff_size, uint32_t data_size);

// Header for a stream whose final length is not known yet.
// RIFF size is 0xFFFFFFFF and data size is 0xFFFFFFFF - 36.
std::vector<uint8_t> voxcast_wav_stream_header(const voxcast_wav_format & fmt);

// Length-correct header for `pcm_bytes` bytes of payload.
std::vector<uint8_t> voxcast_wav_file_header(const voxcast_wav_format & fmt, uint32_t pcm_bytes);

// Parses and validates the first 44 bytes of a WAV stream. Sentinel sizes are accepted.
bool voxcast_wav_parse_header(
        const uint8_t * p,
        size_t n,
        voxcast_wav_format & out,
        uint32_t & data_size,
        std::string & err);

int16_t voxcast_pcm16_from_float(float x);
float voxcast_pcm16_to_float(int16_t s);

void voxcast_pcm16_from_float(const float * in, size_t n, int16_t * out);

// Decodes `n_bytes` of little-endian int16 PCM; a trailing odd byte is ignored.
void voxcast_pcm16le_to_float(const uint8_t * in, size_t n_bytes, std::vector<float> & out);

// Appends little-endian bytes of `n` samples to `out`.
void voxcast_pcm16le_append(const int16_t * samples, size_t n, std::string & out);

// Complete length-correct mono 16-bit WAV file.
std::vector<uint8_t> voxcast_wav_encode(const int16_t * samples, size_t n, uint32_t sample_rate);
std::vector<uint8_t> voxcast_wav_encode_pcm_bytes(const uint8_t * pcm, size_t n_bytes, uint32_t sample_rate);
