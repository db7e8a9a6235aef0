#include "voxcast-wav.h"

#include <algorithm>
#include <cmath>
#include <cstring>

static void put_u16le(uint8_t * p, uint16_t v) {
    p[0] = (uint8_t) (v & 0xFF);
    p[1] = (uint8_t) ((v >> 8) & 0xFF);
}

static void put_u32le(uint8_t * p, uint32_t v) {
    p[0] = (uint8_t) (v & 0xFF);
    p[1] = (uint8_t) ((v >> 8) & 0xFF);
    p[2] = (uint8_t) ((v >> 16) & 0xFF);
    p[3] = (uint8_t) ((v >> 24) & 0xFF);
}

static uint16_t get_u16le(const uint8_t * p) {
    return (uint16_t) (p[0] | (p[1] << 8));
}

static uint32_t get_u32le(const uint8_t * p) {
    return (uint32_t) p[0] |
           ((uint32_t) p[1] << 8) |
           ((uint32_t) p[2] << 16) |
           ((uint32_t) p[3] << 24);
}

void voxcast_wav_write_header(uint8_t * p, const voxcast_wav_format & fmt, uint32_t riff_size, uint32_t data_size) {
    const uint16_t block_align = (uint16_t) (fmt.channels * fmt.bits_per_sample / 8);
    const uint32_t byte_rate = fmt.sample_rate * block_align;
    std::memcpy(p, "RIFF", 4);
    put_u32le(p + 4, riff_size);
    std::memcpy(p + 8, "WAVE", 4);
    std::memcpy(p + 12, "fmt ", 4);
    put_u32le(p + 16, 16);
    put_u16le(p + 20, 1);
    put_u16le(p + 22, fmt.channels);
    put_u32le(p + 24, fmt.sample_rate);
    put_u32le(p + 28, byte_rate);
    put_u16le(p + 32, block_align);
    put_u16le(p + 34, fmt.bits_per_sample);
    std::memcpy(p + 36, "data", 4);
    put_u32le(p + 40, data_size);
}

std::vector<uint8_t> voxcast_wav_stream_header(const voxcast_wav_format & fmt) {
    std::vector<uint8_t> out(k_voxcast_wav_header_bytes);
    voxcast_wav_write_header(out.data(), fmt, k_voxcast_wav_unknown_size, k_voxcast_wav_unknown_size - 36);
    return out;
}

std::vector<uint8_t> voxcast_wav_file_header(const voxcast_wav_format & fmt, uint32_t pcm_bytes) {
    std::vector<uint8_t> out(k_voxcast_wav_header_bytes);
    voxcast_wav_write_header(out.data(), fmt, 36 + pcm_bytes, pcm_bytes);
    return out;
}

bool voxcast_wav_parse_header(
        const uint8_t * p,
        size_t n,
        voxcast_wav_format & out,
        uint32_t & data_size,
        std::string & err) {
    if (p == nullptr || n < k_voxcast_wav_header_bytes) {
        err = "incomplete WAV header";
        return false;
    }
    if (std::memcmp(p, "RIFF", 4) != 0 || std::memcmp(p + 8, "WAVE", 4) != 0) {
        err = "invalid WAV header: missing RIFF/WAVE magic";
        return false;
    }
    if (std::memcmp(p + 12, "fmt ", 4) != 0 || std::memcmp(p + 36, "data", 4) != 0) {
        err = "invalid WAV header: unexpected chunk layout";
        return false;
    }
    if (get_u16le(p + 20) != 1) {
        err = "unsupported WAV format: not PCM";
        return false;
    }

    voxcast_wav_format fmt;
    fmt.channels = get_u16le(p + 22);
    fmt.sample_rate = get_u32le(p + 24);
    fmt.bits_per_sample = get_u16le(p + 34);
    if (fmt.sample_rate < k_voxcast_wav_min_sample_rate || fmt.sample_rate > k_voxcast_wav_max_sample_rate) {
        err = "invalid WAV sample rate: " + std::to_string(fmt.sample_rate);
        return false;
    }
    if (fmt.channels != 1 || fmt.bits_per_sample != 16) {
        err = "unsupported WAV layout: channels=" + std::to_string(fmt.channels) +
              " bits=" + std::to_string(fmt.bits_per_sample);
        return false;
    }

    out = fmt;
    data_size = get_u32le(p + 40);
    return true;
}

int16_t voxcast_pcm16_from_float(float x) {
    if (std::isnan(x)) {
        return 0;
    }
    // Positive full scale is 32767, negative full scale is -32768. Halves round away from zero.
    const float scaled = x >= 0.0f ? x * 32767.0f : x * 32768.0f;
    const long v = std::lround(std::clamp(scaled, -32768.0f, 32767.0f));
    return (int16_t) v;
}

float voxcast_pcm16_to_float(int16_t s) {
    return (float) s / 32768.0f;
}

void voxcast_pcm16_from_float(const float * in, size_t n, int16_t * out) {
    for (size_t i = 0; i < n; ++i) {
        out[i] = voxcast_pcm16_from_float(in[i]);
    }
}

void voxcast_pcm16le_to_float(const uint8_t * in, size_t n_bytes, std::vector<float> & out) {
    const size_t n = n_bytes / 2;
    out.resize(n);
    for (size_t i = 0; i < n; ++i) {
        const int16_t s = (int16_t) get_u16le(in + 2 * i);
        out[i] = voxcast_pcm16_to_float(s);
    }
}

void voxcast_pcm16le_append(const int16_t * samples, size_t n, std::string & out) {
    const size_t base = out.size();
    out.resize(base + 2 * n);
    uint8_t * p = reinterpret_cast<uint8_t *>(&out[base]);
    for (size_t i = 0; i < n; ++i) {
        put_u16le(p + 2 * i, (uint16_t) samples[i]);
    }
}

std::vector<uint8_t> voxcast_wav_encode(const int16_t * samples, size_t n, uint32_t sample_rate) {
    voxcast_wav_format fmt;
    fmt.sample_rate = sample_rate;
    const uint32_t pcm_bytes = (uint32_t) (n * 2);
    std::vector<uint8_t> out(k_voxcast_wav_header_bytes + pcm_bytes);
    voxcast_wav_write_header(out.data(), fmt, 36 + pcm_bytes, pcm_bytes);
    uint8_t * p = out.data() + k_voxcast_wav_header_bytes;
    for (size_t i = 0; i < n; ++i) {
        put_u16le(p + 2 * i, (uint16_t) samples[i]);
    }
    return out;
}

std::vector<uint8_t> voxcast_wav_encode_pcm_bytes(const uint8_t * pcm, size_t n_bytes, uint32_t sample_rate) {
    voxcast_wav_format fmt;
    fmt.sample_rate = sample_rate;
    std::vector<uint8_t> out(k_voxcast_wav_header_bytes + n_bytes);
    voxcast_wav_write_header(out.data(), fmt, (uint32_t) (36 + n_bytes), (uint32_t) n_bytes);
    if (n_bytes > 0) {
        std::memcpy(out.data() + k_voxcast_wav_header_bytes, pcm, n_bytes);
    }
    return out;
}
