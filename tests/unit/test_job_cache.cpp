// Tests for the finished-job cache
// Coverage: lookup, TTL expiry, capacity eviction, re-insert ordering, job ids, concurrent puts

#include <QtTest>

#include <set>
#include <thread>

#include "voxcast-job-cache.h"
#include "../common/test_helpers.h"

static std::vector<int16_t> samples_of(int16_t v, size_t n) {
    return std::vector<int16_t>(n, v);
}

class TestJobCache : public QObject
{
    Q_OBJECT

private slots:
    void test_put_then_get_returns_identical_samples() {
        voxcast_job_cache cache(1000, 10);
        const std::vector<int16_t> s = {1, -2, 3, 32767, -32768};
        cache.put("a", s, 24000, 0);

        voxcast_job job;
        QVERIFY(cache.get("a", 500, job));
        QVERIFY(job.samples == s);
        QCOMPARE(job.sample_rate, 24000);
        QCOMPARE(qs(job.id), QString("a"));
    }

    void test_unknown_id_is_missing() {
        voxcast_job_cache cache(1000, 10);
        voxcast_job job;
        QVERIFY(!cache.get("nope", 0, job));
    }

    void test_entry_at_exact_ttl_is_still_served() {
        voxcast_job_cache cache(1000, 10);
        cache.put("a", samples_of(1, 4), 24000, 0);
        voxcast_job job;
        QVERIFY(cache.get("a", 1000, job));
    }

    void test_expired_entry_is_deleted_on_read() {
        voxcast_job_cache cache(1000, 10);
        cache.put("a", samples_of(1, 4), 24000, 0);
        cache.put("b", samples_of(2, 4), 24000, 0);

        voxcast_job job;
        QVERIFY(!cache.get("a", 1001, job));
        // only the queried entry goes; b waits for the next put
        QCOMPARE((int) cache.size(), 1);
    }

    void test_put_sweeps_expired_entries() {
        voxcast_job_cache cache(1000, 2);
        cache.put("a", samples_of(1, 4), 24000, 0);
        cache.put("b", samples_of(2, 4), 24000, 0);
        cache.put("c", samples_of(3, 4), 24000, 1500);

        QCOMPARE((int) cache.size(), 1);
        voxcast_job job;
        QVERIFY(cache.get("c", 1500, job));
    }

    void test_capacity_evicts_oldest_insert() {
        voxcast_job_cache cache(100000, 3);
        cache.put("a", samples_of(1, 1), 24000, 0);
        cache.put("b", samples_of(2, 1), 24000, 1);
        cache.put("c", samples_of(3, 1), 24000, 2);
        cache.put("d", samples_of(4, 1), 24000, 3);

        QCOMPARE((int) cache.size(), 3);
        voxcast_job job;
        QVERIFY(!cache.get("a", 4, job));
        QVERIFY(cache.get("b", 4, job));
        QVERIFY(cache.get("c", 4, job));
        QVERIFY(cache.get("d", 4, job));
    }

    void test_reinsert_moves_entry_to_newest() {
        voxcast_job_cache cache(100000, 2);
        cache.put("a", samples_of(1, 1), 24000, 0);
        cache.put("b", samples_of(2, 1), 24000, 1);
        cache.put("a", samples_of(5, 1), 16000, 2);
        cache.put("c", samples_of(3, 1), 24000, 3);

        voxcast_job job;
        QVERIFY(!cache.get("b", 4, job));
        QVERIFY(cache.get("a", 4, job));
        QCOMPARE((int) job.samples[0], 5);
        QCOMPARE(job.sample_rate, 16000);
    }

    void test_store_mints_distinct_valid_ids() {
        voxcast_job_cache cache(100000, 100);
        std::set<std::string> ids;
        for (int i = 0; i < 50; ++i) {
            const std::string id = cache.store(samples_of(1, 2), 24000, i);
            QVERIFY(voxcast_is_valid_job_id(id));
            ids.insert(id);
        }
        QCOMPARE((int) ids.size(), 50);
    }

    void test_job_id_validation() {
        QVERIFY(voxcast_is_valid_job_id("123e4567-e89b-42d3-a456-426614174000"));
        QVERIFY(!voxcast_is_valid_job_id("123E4567-E89B-42D3-A456-426614174000"));
        QVERIFY(!voxcast_is_valid_job_id("123e4567e89b42d3a456426614174000"));
        QVERIFY(!voxcast_is_valid_job_id("../../etc/passwd"));
        QVERIFY(!voxcast_is_valid_job_id(""));
        QVERIFY(!voxcast_is_valid_job_id("123e4567-e89b-42d3-a456-42661417400g"));
    }

    void test_concurrent_puts_respect_capacity() {
        voxcast_job_cache cache(100000, 100);
        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([&cache, t]() {
                for (int i = 0; i < 50; ++i) {
                    cache.store(samples_of((int16_t) t, 8), 24000, i);
                }
            });
        }
        for (auto & w : workers) {
            w.join();
        }
        QCOMPARE((int) cache.size(), 100);
    }
};

QTEST_MAIN(TestJobCache)
#include "test_job_cache.moc"
