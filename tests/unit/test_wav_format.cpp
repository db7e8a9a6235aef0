// Tests for the 44-byte WAV header writer/parser and PCM sample conversion
// Coverage: streaming sentinels, length-correct files, header validation, clamping

#include <QtTest>

#include <cmath>
#include <limits>

#include "voxcast-wav.h"
#include "../common/test_helpers.h"

class TestWavFormat : public QObject
{
    Q_OBJECT

private slots:
    void test_stream_header_layout() {
        voxcast_wav_format fmt;
        fmt.sample_rate = 24000;
        const std::vector<uint8_t> h = voxcast_wav_stream_header(fmt);

        QCOMPARE((int) h.size(), 44);
        QVERIFY(std::memcmp(h.data(), "RIFF", 4) == 0);
        QVERIFY(std::memcmp(h.data() + 8, "WAVE", 4) == 0);
        QVERIFY(std::memcmp(h.data() + 12, "fmt ", 4) == 0);
        QVERIFY(std::memcmp(h.data() + 36, "data", 4) == 0);

        QCOMPARE(read_u32le(h.data() + 4), 0xFFFFFFFFu);
        QCOMPARE(read_u32le(h.data() + 16), 16u);
        QCOMPARE((int) read_u16le(h.data() + 20), 1);
        QCOMPARE((int) read_u16le(h.data() + 22), 1);
        QCOMPARE(read_u32le(h.data() + 24), 24000u);
        QCOMPARE(read_u32le(h.data() + 28), 48000u);
        QCOMPARE((int) read_u16le(h.data() + 32), 2);
        QCOMPARE((int) read_u16le(h.data() + 34), 16);
        QCOMPARE(read_u32le(h.data() + 40), 0xFFFFFFFFu - 36u);
    }

    void test_file_header_is_length_correct() {
        voxcast_wav_format fmt;
        fmt.sample_rate = 22050;
        const std::vector<uint8_t> h = voxcast_wav_file_header(fmt, 6000);

        QCOMPARE(read_u32le(h.data() + 4), 6036u);
        QCOMPARE(read_u32le(h.data() + 24), 22050u);
        QCOMPARE(read_u32le(h.data() + 40), 6000u);
    }

    void test_parse_header_extracts_rate() {
        const std::string h = stream_header_bytes(24000);
        voxcast_wav_format fmt;
        uint32_t data_size = 0;
        std::string err;

        QVERIFY(voxcast_wav_parse_header(reinterpret_cast<const uint8_t *>(h.data()), h.size(), fmt, data_size, err));
        QCOMPARE(fmt.sample_rate, 24000u);
        QCOMPARE((int) fmt.channels, 1);
        QCOMPARE((int) fmt.bits_per_sample, 16);
        QCOMPARE(data_size, 0xFFFFFFFFu - 36u);
    }

    void test_parse_header_rejects_bad_magic() {
        std::string h = stream_header_bytes(24000);
        h[3] = 'X';
        voxcast_wav_format fmt;
        uint32_t data_size = 0;
        std::string err;

        QVERIFY(!voxcast_wav_parse_header(reinterpret_cast<const uint8_t *>(h.data()), h.size(), fmt, data_size, err));
        QVERIFY(qs(err).contains("RIFF"));
    }

    void test_parse_header_rejects_short_input() {
        const std::string h = stream_header_bytes(24000).substr(0, 30);
        voxcast_wav_format fmt;
        uint32_t data_size = 0;
        std::string err;

        QVERIFY(!voxcast_wav_parse_header(reinterpret_cast<const uint8_t *>(h.data()), h.size(), fmt, data_size, err));
    }

    void test_parse_header_rejects_implausible_rates() {
        for (uint32_t rate : {0u, 500u, 1000000u}) {
            const std::string h = stream_header_bytes(rate);
            voxcast_wav_format fmt;
            uint32_t data_size = 0;
            std::string err;
            QVERIFY(!voxcast_wav_parse_header(reinterpret_cast<const uint8_t *>(h.data()), h.size(), fmt, data_size, err));
            QVERIFY(qs(err).contains("sample rate"));
        }
    }

    void test_float_to_pcm16_full_scale() {
        QCOMPARE((int) voxcast_pcm16_from_float(1.0f), 32767);
        QCOMPARE((int) voxcast_pcm16_from_float(-1.0f), -32768);
        QCOMPARE((int) voxcast_pcm16_from_float(0.0f), 0);
    }

    void test_float_to_pcm16_clamps_and_rounds() {
        QCOMPARE((int) voxcast_pcm16_from_float(2.5f), 32767);
        QCOMPARE((int) voxcast_pcm16_from_float(-7.0f), -32768);
        QCOMPARE((int) voxcast_pcm16_from_float(0.25f), 8192);
        QCOMPARE((int) voxcast_pcm16_from_float(-0.5f), -16384);
        // -2.5 and -3.5 after scaling: halves go away from zero, not to even
        QCOMPARE((int) voxcast_pcm16_from_float(-2.5f / 32768.0f), -3);
        QCOMPARE((int) voxcast_pcm16_from_float(-3.5f / 32768.0f), -4);
        QCOMPARE((int) voxcast_pcm16_from_float(std::numeric_limits<float>::quiet_NaN()), 0);
    }

    void test_pcm16_to_float() {
        QCOMPARE(voxcast_pcm16_to_float(-32768), -1.0f);
        QCOMPARE(voxcast_pcm16_to_float(16384), 0.5f);
        QCOMPARE(voxcast_pcm16_to_float(0), 0.0f);
    }

    void test_pcm16le_decode_ignores_odd_byte() {
        const std::string bytes = constant_pcm_bytes(6, -16384) + "x";
        std::vector<float> out;
        voxcast_pcm16le_to_float(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size(), out);

        QCOMPARE((int) out.size(), 3);
        for (float v : out) {
            QCOMPARE(v, -0.5f);
        }
    }

    void test_encode_full_file() {
        const int16_t samples[] = {32767, -32768, 1};
        const std::vector<uint8_t> wav = voxcast_wav_encode(samples, 3, 16000);

        QCOMPARE((int) wav.size(), 50);
        QCOMPARE(read_u32le(wav.data() + 4), 42u);
        QCOMPARE(read_u32le(wav.data() + 24), 16000u);
        QCOMPARE(read_u32le(wav.data() + 40), 6u);
        QCOMPARE((int) read_i16le(wav.data() + 44), 32767);
        QCOMPARE((int) read_i16le(wav.data() + 46), -32768);
        QCOMPARE((int) read_i16le(wav.data() + 48), 1);
    }
};

QTEST_MAIN(TestWavFormat)
#include "test_wav_format.moc"
