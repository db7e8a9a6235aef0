#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// In-band control markers appended after the last PCM byte of a stream.
static constexpr const char * k_voxcast_marker_open         = "<!--";
static constexpr const char * k_voxcast_job_id_marker_prefix = "<!--JOB_ID:";
static constexpr const char * k_voxcast_error_marker_prefix  = "<!--ERROR:";
static constexpr const char * k_voxcast_marker_close        = "-->";

enum voxcast_marker_type {
    VOXCAST_MARKER_NONE   = 0,
    VOXCAST_MARKER_JOB_ID = 1,
    VOXCAST_MARKER_ERROR  = 2,
};

struct voxcast_marker {
    voxcast_marker_type type = VOXCAST_MARKER_NONE;
    size_t offset = 0; // position of "<!--" in the scanned buffer
    size_t length = 0; // bytes up to and including "-->"
    std::string value;
};

std::string voxcast_format_job_id_marker(const std::string & job_id);
std::string voxcast_format_error_marker(const std::string & message);

// First complete marker in [data, data + n). Returns false when none is found.
bool voxcast_find_marker(const uint8_t * data, size_t n, voxcast_marker & out);

// The marker that closes the stream: the buffer must end with "-->" and the
// value starts after the last marker prefix before it.
bool voxcast_find_terminal_marker(const uint8_t * data, size_t n, voxcast_marker & out);

// Offset of the first job-id/error marker prefix, complete or not closed yet.
// Returns std::string::npos when no prefix is present.
size_t voxcast_find_marker_start(const uint8_t * data, size_t n);

// Length of the longest buffer suffix that could still grow into a marker prefix.
size_t voxcast_marker_partial_tail(const uint8_t * data, size_t n);

const char * voxcast_marker_type_to_cstr(voxcast_marker_type t);
