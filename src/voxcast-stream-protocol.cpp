#include "voxcast-stream-protocol.h"

#include <algorithm>
#include <cstring>

// A space goes in wherever the value would otherwise spell "-->" or "<!--",
// so a value can neither close its marker early nor open another one.
static std::string sanitize_marker_value(const std::string & in) {
    std::string out;
    out.reserve(in.size());
    auto ends_with = [&out](const char * tail) {
        const size_t n = std::strlen(tail);
        return out.size() >= n && out.compare(out.size() - n, n, tail) == 0;
    };
    for (char c : in) {
        if ((c == '>' && ends_with("--")) || (c == '-' && ends_with("<!-"))) {
            out += ' ';
        }
        out += c;
    }
    return out;
}

std::string voxcast_format_job_id_marker(const std::string & job_id) {
    return std::string(k_voxcast_job_id_marker_prefix) + sanitize_marker_value(job_id) + k_voxcast_marker_close;
}

std::string voxcast_format_error_marker(const std::string & message) {
    return std::string(k_voxcast_error_marker_prefix) + sanitize_marker_value(message) + k_voxcast_marker_close;
}

static size_t find_bytes(const uint8_t * data, size_t n, const char * needle, size_t from) {
    const size_t m = std::strlen(needle);
    if (m == 0 || n < m || from > n - m) {
        return std::string::npos;
    }
    const uint8_t * begin = data + from;
    const uint8_t * end = data + n;
    const uint8_t * it = std::search(begin, end,
            reinterpret_cast<const uint8_t *>(needle),
            reinterpret_cast<const uint8_t *>(needle) + m);
    if (it == end) {
        return std::string::npos;
    }
    return (size_t) (it - data);
}

size_t voxcast_find_marker_start(const uint8_t * data, size_t n) {
    const size_t a = find_bytes(data, n, k_voxcast_job_id_marker_prefix, 0);
    const size_t b = find_bytes(data, n, k_voxcast_error_marker_prefix, 0);
    return std::min(a, b);
}

bool voxcast_find_marker(const uint8_t * data, size_t n, voxcast_marker & out) {
    size_t from = 0;
    while (from < n) {
        const size_t a = find_bytes(data, n, k_voxcast_job_id_marker_prefix, from);
        const size_t b = find_bytes(data, n, k_voxcast_error_marker_prefix, from);
        const size_t start = std::min(a, b);
        if (start == std::string::npos) {
            return false;
        }

        const bool is_job = start == a;
        const size_t prefix_len = std::strlen(is_job ? k_voxcast_job_id_marker_prefix : k_voxcast_error_marker_prefix);
        const size_t value_begin = start + prefix_len;
        const size_t close = find_bytes(data, n, k_voxcast_marker_close, value_begin);
        if (close == std::string::npos) {
            return false;
        }

        std::string value(reinterpret_cast<const char *>(data + value_begin), close - value_begin);
        if (is_job && (value.empty() || value.find('>') != std::string::npos)) {
            // job ids never contain '>'; keep scanning past this candidate
            from = start + 1;
            continue;
        }

        out.type = is_job ? VOXCAST_MARKER_JOB_ID : VOXCAST_MARKER_ERROR;
        out.offset = start;
        out.length = close + 3 - start;
        out.value = std::move(value);
        return true;
    }
    return false;
}

static size_t rfind_bytes(const uint8_t * data, size_t n, const char * needle) {
    const size_t m = std::strlen(needle);
    if (m == 0 || n < m) {
        return std::string::npos;
    }
    for (size_t i = n - m + 1; i-- > 0;) {
        if (std::memcmp(data + i, needle, m) == 0) {
            return i;
        }
    }
    return std::string::npos;
}

bool voxcast_find_terminal_marker(const uint8_t * data, size_t n, voxcast_marker & out) {
    // tolerate trailing whitespace after the marker
    while (n > 0 && (data[n - 1] == '\n' || data[n - 1] == '\r' || data[n - 1] == ' ')) {
        --n;
    }
    if (n < 3 || std::memcmp(data + n - 3, k_voxcast_marker_close, 3) != 0) {
        return false;
    }
    const size_t body_end = n - 3;
    const size_t a = rfind_bytes(data, body_end, k_voxcast_job_id_marker_prefix);
    const size_t b = rfind_bytes(data, body_end, k_voxcast_error_marker_prefix);

    size_t start = std::string::npos;
    bool is_job = false;
    if (a != std::string::npos && (b == std::string::npos || a > b)) {
        start = a;
        is_job = true;
    } else if (b != std::string::npos) {
        start = b;
    }
    if (start == std::string::npos) {
        return false;
    }

    const size_t prefix_len = std::strlen(is_job ? k_voxcast_job_id_marker_prefix : k_voxcast_error_marker_prefix);
    std::string value(reinterpret_cast<const char *>(data + start + prefix_len), body_end - start - prefix_len);
    if (is_job && (value.empty() || value.find('>') != std::string::npos)) {
        return false;
    }

    out.type = is_job ? VOXCAST_MARKER_JOB_ID : VOXCAST_MARKER_ERROR;
    out.offset = start;
    out.length = n - start;
    out.value = std::move(value);
    return true;
}

size_t voxcast_marker_partial_tail(const uint8_t * data, size_t n) {
    const char * prefixes[] = { k_voxcast_job_id_marker_prefix, k_voxcast_error_marker_prefix };
    size_t best = 0;
    for (const char * prefix : prefixes) {
        const size_t m = std::strlen(prefix);
        const size_t max_len = std::min(n, m - 1);
        for (size_t len = max_len; len > best; --len) {
            if (std::memcmp(data + n - len, prefix, len) == 0) {
                best = len;
                break;
            }
        }
    }
    return best;
}

const char * voxcast_marker_type_to_cstr(voxcast_marker_type t) {
    switch (t) {
        case VOXCAST_MARKER_JOB_ID: return "job_id";
        case VOXCAST_MARKER_ERROR:  return "error";
        case VOXCAST_MARKER_NONE:
        default:                    return "none";
    }
}
