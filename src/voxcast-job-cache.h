#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

static constexpr int64_t k_voxcast_default_cache_ttl_ms  = 3600 * 1000;
static constexpr size_t  k_voxcast_default_cache_entries = 100;

struct voxcast_job {
    std::string id;
    int32_t sample_rate = 0;
    std::vector<int16_t> samples;
    int64_t created_at_ms = 0;
};

// Finished generations keyed by job id, bounded by age and by count.
// Every mutation and every expiry-check-on-read runs under one mutex.
class voxcast_job_cache {
public:
    voxcast_job_cache(int64_t ttl_ms, size_t max_entries);

    voxcast_job_cache(const voxcast_job_cache &) = delete;
    voxcast_job_cache & operator=(const voxcast_job_cache &) = delete;

    // Inserts (or re-inserts) the job timestamped `now_ms`, then drops every
    // entry older than the TTL, then evicts oldest-inserted until within capacity.
    void put(const std::string & job_id, std::vector<int16_t> samples, int32_t sample_rate, int64_t now_ms);

    // Copies the job out. An entry found past its TTL is deleted and reported missing.
    bool get(const std::string & job_id, int64_t now_ms, voxcast_job & out);

    // Mints a fresh job id and stores the samples under it.
    std::string store(std::vector<int16_t> samples, int32_t sample_rate, int64_t now_ms);

    size_t size() const;
    int64_t ttl_ms() const { return ttl_ms_; }
    size_t max_entries() const { return max_entries_; }

private:
    struct entry {
        voxcast_job job;
        std::list<std::string>::iterator order_it;
    };

    void erase_locked(std::unordered_map<std::string, entry>::iterator it);
    bool expired(const voxcast_job & job, int64_t now_ms) const;

    const int64_t ttl_ms_;
    const size_t max_entries_;

    mutable std::mutex mtx_;
    std::list<std::string> order_;
    std::unordered_map<std::string, entry> entries_;
};

int64_t voxcast_now_ms();

// Random lowercase UUIDv4.
std::string voxcast_make_job_id();
bool voxcast_is_valid_job_id(const std::string & id);
