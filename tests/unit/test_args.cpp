// Tests for command-line value parsing shared by the server and client
// Coverage: int32 range checks, trailing junk, comma-separated lists

#include <QtTest>

#include "voxcast-args.h"
#include "../common/test_helpers.h"

class TestArgs : public QObject
{
    Q_OBJECT

private slots:
    void test_parse_i32_accepts_bounds() {
        int32_t v = 7;
        QVERIFY(voxcast_parse_i32("2147483647", v));
        QCOMPARE(v, (int32_t) 2147483647);
        QVERIFY(voxcast_parse_i32("-2147483648", v));
        QCOMPARE(v, (int32_t) (-2147483647 - 1));
        QVERIFY(voxcast_parse_i32("100", v));
        QCOMPARE(v, (int32_t) 100);
    }

    void test_parse_i32_rejects_out_of_range() {
        int32_t v = 42;
        QVERIFY(!voxcast_parse_i32("4294967297", v));
        QVERIFY(!voxcast_parse_i32("2147483648", v));
        QVERIFY(!voxcast_parse_i32("-2147483649", v));
        QVERIFY(!voxcast_parse_i32("99999999999999999999999", v));
        QCOMPARE(v, (int32_t) 42);
    }

    void test_parse_i32_rejects_junk() {
        int32_t v = 42;
        QVERIFY(!voxcast_parse_i32("12x", v));
        QVERIFY(!voxcast_parse_i32("", v));
        QVERIFY(!voxcast_parse_i32(nullptr, v));
        QCOMPARE(v, (int32_t) 42);
    }

    void test_trim_copy() {
        QCOMPARE(qs(voxcast_trim_copy("  GPU0\t")), QString("GPU0"));
        QCOMPARE(qs(voxcast_trim_copy("   ")), QString(""));
    }

    void test_csv_list_drops_empty_tokens() {
        std::vector<std::string> out;
        QVERIFY(voxcast_parse_csv_list(" CUDA0, ,CUDA1 ,", out));
        QCOMPARE((int) out.size(), 2);
        QCOMPARE(qs(out[0]), QString("CUDA0"));
        QCOMPARE(qs(out[1]), QString("CUDA1"));

        QVERIFY(!voxcast_parse_csv_list(" , ", out));
        QVERIFY(out.empty());
    }
};

QTEST_MAIN(TestArgs)
#include "test_args.moc"
