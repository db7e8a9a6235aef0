#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Whole-string base-10 parse; false on trailing junk or a value outside int32_t.
bool voxcast_parse_i32(const char * s, int32_t & out);

std::string voxcast_trim_copy(const std::string & in);

// Splits on ',' and trims each token; empty tokens are dropped.
// Returns false when nothing is left.
bool voxcast_parse_csv_list(const std::string & raw, std::vector<std::string> & out);
