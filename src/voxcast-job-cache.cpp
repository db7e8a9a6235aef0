#include "voxcast-job-cache.h"

#include <chrono>
#include <iterator>
#include <random>

voxcast_job_cache::voxcast_job_cache(int64_t ttl_ms, size_t max_entries)
    : ttl_ms_(ttl_ms), max_entries_(max_entries) {
}

bool voxcast_job_cache::expired(const voxcast_job & job, int64_t now_ms) const {
    return now_ms - job.created_at_ms > ttl_ms_;
}

void voxcast_job_cache::erase_locked(std::unordered_map<std::string, entry>::iterator it) {
    order_.erase(it->second.order_it);
    entries_.erase(it);
}

void voxcast_job_cache::put(const std::string & job_id, std::vector<int16_t> samples, int32_t sample_rate, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mtx_);

    auto existing = entries_.find(job_id);
    if (existing != entries_.end()) {
        erase_locked(existing);
    }

    order_.push_back(job_id);
    entry e;
    e.job.id = job_id;
    e.job.sample_rate = sample_rate;
    e.job.samples = std::move(samples);
    e.job.created_at_ms = now_ms;
    e.order_it = std::prev(order_.end());
    entries_.emplace(job_id, std::move(e));

    for (auto it = order_.begin(); it != order_.end();) {
        auto found = entries_.find(*it);
        if (found != entries_.end() && expired(found->second.job, now_ms)) {
            ++it;
            erase_locked(found);
        } else {
            ++it;
        }
    }

    while (entries_.size() > max_entries_ && !order_.empty()) {
        auto oldest = entries_.find(order_.front());
        if (oldest == entries_.end()) {
            order_.pop_front();
            continue;
        }
        erase_locked(oldest);
    }
}

bool voxcast_job_cache::get(const std::string & job_id, int64_t now_ms, voxcast_job & out) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(job_id);
    if (it == entries_.end()) {
        return false;
    }
    if (expired(it->second.job, now_ms)) {
        erase_locked(it);
        return false;
    }
    out = it->second.job;
    return true;
}

std::string voxcast_job_cache::store(std::vector<int16_t> samples, int32_t sample_rate, int64_t now_ms) {
    std::string id = voxcast_make_job_id();
    put(id, std::move(samples), sample_rate, now_ms);
    return id;
}

size_t voxcast_job_cache::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

int64_t voxcast_now_ms() {
    const auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string voxcast_make_job_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    const uint64_t hi = (dist(rng) & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    const uint64_t lo = (dist(rng) & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    auto append = [&](uint64_t v, int nibbles) {
        for (int i = nibbles - 1; i >= 0; --i) {
            out += hex[(v >> (4 * i)) & 0xF];
        }
    };
    append(hi >> 32, 8);
    out += '-';
    append((hi >> 16) & 0xFFFF, 4);
    out += '-';
    append(hi & 0xFFFF, 4);
    out += '-';
    append(lo >> 48, 4);
    out += '-';
    append(lo & 0xFFFFFFFFFFFFull, 12);
    return out;
}

bool voxcast_is_valid_job_id(const std::string & id) {
    if (id.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < id.size(); ++i) {
        const char c = id[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') {
                return false;
            }
            continue;
        }
        const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!ok) {
            return false;
        }
    }
    return true;
}
