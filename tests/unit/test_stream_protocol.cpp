// Tests for in-band control markers
// Coverage: formatting, first/terminal marker scans, partial-prefix holdback

#include <QtTest>

#include "voxcast-stream-protocol.h"
#include "../common/test_helpers.h"

static const uint8_t * bytes(const std::string & s) {
    return reinterpret_cast<const uint8_t *>(s.data());
}

class TestStreamProtocol : public QObject
{
    Q_OBJECT

private slots:
    void test_format_markers() {
        QCOMPARE(qs(voxcast_format_job_id_marker("abc123")), QString("<!--JOB_ID:abc123-->"));
        QCOMPARE(qs(voxcast_format_error_marker("out of memory")), QString("<!--ERROR:out of memory-->"));
    }

    void test_error_message_cannot_close_marker_early() {
        const std::string m = voxcast_format_error_marker("bad --> input");
        QCOMPARE(qs(m), QString("<!--ERROR:bad -- > input-->"));

        voxcast_marker marker;
        QVERIFY(voxcast_find_marker(bytes(m), m.size(), marker));
        QCOMPARE(qs(marker.value), QString("bad -- > input"));
        QCOMPARE((int) marker.length, (int) m.size());
    }

    void test_error_message_cannot_open_another_marker() {
        const std::string m = voxcast_format_error_marker("upstream said <!--JOB_ID:deadbeef");
        QCOMPARE(qs(m), QString("<!--ERROR:upstream said <!- -JOB_ID:deadbeef-->"));

        voxcast_marker marker;
        QVERIFY(voxcast_find_terminal_marker(bytes(m), m.size(), marker));
        QCOMPARE((int) marker.type, (int) VOXCAST_MARKER_ERROR);
        QCOMPARE((int) marker.offset, 0);
        QCOMPARE(qs(marker.value), QString("upstream said <!- -JOB_ID:deadbeef"));
    }

    void test_overlapping_open_and_close_sequences() {
        const std::string m = voxcast_format_error_marker("a<!--->b");
        const std::string value = m.substr(std::strlen(k_voxcast_error_marker_prefix),
                m.size() - std::strlen(k_voxcast_error_marker_prefix) - 3);
        QVERIFY(value.find("<!--") == std::string::npos);
        QVERIFY(value.find("-->") == std::string::npos);

        voxcast_marker marker;
        QVERIFY(voxcast_find_terminal_marker(bytes(m), m.size(), marker));
        QCOMPARE((int) marker.type, (int) VOXCAST_MARKER_ERROR);
        QCOMPARE(qs(marker.value), qs(value));
    }

    void test_find_marker_after_pcm() {
        const std::string buf = constant_pcm_bytes(100, 1000) + "<!--JOB_ID:abc123-->";
        voxcast_marker marker;
        QVERIFY(voxcast_find_marker(bytes(buf), buf.size(), marker));
        QCOMPARE((int) marker.type, (int) VOXCAST_MARKER_JOB_ID);
        QCOMPARE((int) marker.offset, 100);
        QCOMPARE(qs(marker.value), QString("abc123"));
    }

    void test_find_marker_requires_close() {
        const std::string buf = "<!--ERROR:still arriv";
        voxcast_marker marker;
        QVERIFY(!voxcast_find_marker(bytes(buf), buf.size(), marker));
        QCOMPARE((int) voxcast_find_marker_start(bytes(buf), buf.size()), 0);
    }

    void test_terminal_marker_tolerates_trailing_whitespace() {
        const std::string buf = constant_pcm_bytes(10, 1000) + "<!--JOB_ID:abc-->\r\n";
        voxcast_marker marker;
        QVERIFY(voxcast_find_terminal_marker(bytes(buf), buf.size(), marker));
        QCOMPARE((int) marker.offset, 10);
        QCOMPARE(qs(marker.value), QString("abc"));
    }

    void test_terminal_marker_takes_last_prefix() {
        const std::string buf = "<!--JOB_ID:x--><!--ERROR:boom-->";
        voxcast_marker marker;
        QVERIFY(voxcast_find_terminal_marker(bytes(buf), buf.size(), marker));
        QCOMPARE((int) marker.type, (int) VOXCAST_MARKER_ERROR);
        QCOMPARE(qs(marker.value), QString("boom"));
    }

    void test_terminal_marker_missing() {
        const std::string buf = constant_pcm_bytes(64, 1000);
        voxcast_marker marker;
        QVERIFY(!voxcast_find_terminal_marker(bytes(buf), buf.size(), marker));
    }

    void test_partial_tail() {
        const std::string a = constant_pcm_bytes(8, 1000) + "<!--JO";
        const std::string b = constant_pcm_bytes(8, 1000) + "<";
        const std::string c = constant_pcm_bytes(8, 1000) + "<!--ERROR";
        const std::string d = constant_pcm_bytes(8, 1000);

        QCOMPARE((int) voxcast_marker_partial_tail(bytes(a), a.size()), 6);
        QCOMPARE((int) voxcast_marker_partial_tail(bytes(b), b.size()), 1);
        QCOMPARE((int) voxcast_marker_partial_tail(bytes(c), c.size()), 9);
        QCOMPARE((int) voxcast_marker_partial_tail(bytes(d), d.size()), 0);
    }

    void test_marker_type_names() {
        QCOMPARE(QString(voxcast_marker_type_to_cstr(VOXCAST_MARKER_JOB_ID)), QString("job_id"));
        QCOMPARE(QString(voxcast_marker_type_to_cstr(VOXCAST_MARKER_ERROR)), QString("error"));
    }
};

QTEST_MAIN(TestStreamProtocol)
#include "test_stream_protocol.moc"
