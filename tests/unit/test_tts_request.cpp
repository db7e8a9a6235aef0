// Tests for TTS request validation
// Coverage: required fields per mode, length limits counted in characters, reference ids, device index

#include <QtTest>

#include "voxcast-service.h"
#include "../common/test_helpers.h"

using json = nlohmann::ordered_json;

static bool parse(const json & body, voxcast_tts_mode mode, voxcast_tts_request & out, std::string & err, size_t n_devices = 2) {
    voxcast_service_config cfg;
    return voxcast_parse_tts_request(body, mode, cfg, n_devices, out, err);
}

class TestTtsRequest : public QObject
{
    Q_OBJECT

private slots:
    void test_default_mode_minimal_body() {
        voxcast_tts_request r;
        std::string err;
        QVERIFY(parse({{"text", "hello"}, {"language", "en"}}, VOXCAST_TTS_MODE_DEFAULT, r, err));
        QCOMPARE(qs(r.text), QString("hello"));
        QCOMPARE(qs(r.language), QString("en"));
        QCOMPARE((int) r.device_index, 0);
        QCOMPARE(qs(r.body["text"].get<std::string>()), QString("hello"));
    }

    void test_text_is_required() {
        voxcast_tts_request r;
        std::string err;
        QVERIFY(!parse(json::object(), VOXCAST_TTS_MODE_DEFAULT, r, err));
        QCOMPARE(qs(err), QString("Text is required"));
        QVERIFY(!parse({{"text", "   "}}, VOXCAST_TTS_MODE_DEFAULT, r, err));
        QCOMPARE(qs(err), QString("Text is required"));
    }

    void test_text_length_counts_characters() {
        voxcast_tts_request r;
        std::string err;

        std::string wide;
        for (int i = 0; i < 5000; ++i) {
            wide += "\xE3\x81\x82";
        }
        QVERIFY(parse({{"text", wide}}, VOXCAST_TTS_MODE_DEFAULT, r, err));
        QVERIFY(!parse({{"text", wide + "a"}}, VOXCAST_TTS_MODE_DEFAULT, r, err));
        QCOMPARE(qs(err), QString("Text too long (max 5000 characters)"));
    }

    void test_non_string_text_is_rejected() {
        voxcast_tts_request r;
        std::string err;
        QVERIFY(!parse({{"text", 42}}, VOXCAST_TTS_MODE_DEFAULT, r, err));
        QVERIFY(!err.empty());
    }

    void test_clone_needs_valid_reference() {
        voxcast_tts_request r;
        std::string err;
        QVERIFY(!parse({{"text", "hi"}}, VOXCAST_TTS_MODE_CLONE, r, err));
        QCOMPARE(qs(err), QString("Reference audio is required"));

        QVERIFY(!parse({{"text", "hi"}, {"ref_audio_ids", {"../x"}}}, VOXCAST_TTS_MODE_CLONE, r, err));
        QCOMPARE(qs(err), QString("Invalid reference audio ID"));

        const std::string id = voxcast_make_job_id();
        QVERIFY(parse({{"text", "hi"}, {"ref_audio_ids", {id}}}, VOXCAST_TTS_MODE_CLONE, r, err));
        QCOMPARE((int) r.ref_audio_ids.size(), 1);
        QCOMPARE(qs(r.ref_audio_ids[0]), qs(id));
    }

    void test_custom_needs_speaker() {
        voxcast_tts_request r;
        std::string err;
        QVERIFY(!parse({{"text", "hi"}}, VOXCAST_TTS_MODE_CUSTOM, r, err));
        QCOMPARE(qs(err), QString("Speaker is required"));
        QVERIFY(parse({{"text", "hi"}, {"speaker", "aiden"}}, VOXCAST_TTS_MODE_CUSTOM, r, err));
    }

    void test_design_needs_instruct() {
        voxcast_tts_request r;
        std::string err;
        QVERIFY(!parse({{"text", "hi"}}, VOXCAST_TTS_MODE_DESIGN, r, err));
        QCOMPARE(qs(err), QString("Voice description is required"));

        QVERIFY(!parse({{"text", "hi"}, {"instruct", std::string(501, 'x')}}, VOXCAST_TTS_MODE_DESIGN, r, err));
        QVERIFY(qs(err).startsWith("Instruct too long"));

        QVERIFY(parse({{"text", "hi"}, {"instruct", "calm, low voice"}}, VOXCAST_TTS_MODE_DESIGN, r, err));
    }

    void test_device_index_bounds() {
        voxcast_tts_request r;
        std::string err;
        QVERIFY(parse({{"text", "hi"}, {"device", 1}}, VOXCAST_TTS_MODE_DEFAULT, r, err));
        QCOMPARE((int) r.device_index, 1);

        QVERIFY(!parse({{"text", "hi"}, {"device", 2}}, VOXCAST_TTS_MODE_DEFAULT, r, err));
        QCOMPARE(qs(err), QString("invalid device index 2 (available: 2)"));
        QVERIFY(!parse({{"text", "hi"}, {"device", -1}}, VOXCAST_TTS_MODE_DEFAULT, r, err));
        QVERIFY(!parse({{"text", "hi"}, {"device", "0"}}, VOXCAST_TTS_MODE_DEFAULT, r, err));
    }

    void test_non_object_body() {
        voxcast_tts_request r;
        std::string err;
        QVERIFY(!parse(json::array({1, 2}), VOXCAST_TTS_MODE_DEFAULT, r, err));
    }

    void test_mode_names() {
        voxcast_tts_mode m = VOXCAST_TTS_MODE_DEFAULT;
        QVERIFY(voxcast_parse_tts_mode("clone", m));
        QCOMPARE((int) m, (int) VOXCAST_TTS_MODE_CLONE);
        QVERIFY(voxcast_parse_tts_mode("design", m));
        QCOMPARE(QString(voxcast_tts_mode_to_cstr(m)), QString("design"));
        QVERIFY(!voxcast_parse_tts_mode("karaoke", m));
    }
};

QTEST_MAIN(TestTtsRequest)
#include "test_tts_request.moc"
