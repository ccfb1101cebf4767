// **********************************************************************
// rvlite/include/util/FlatBinLoader.hpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
Load a flat (headerless) .bin image into a hart's physical memory at offset 0.
The hart is reset as part of the load.
*/
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rvlite {

class Hart;

bool read_flat_bin(const std::string& path, std::vector<uint8_t>* bytes);
bool load_flat_bin(const std::string& path, Hart* hart, uint32_t* nbytes);

} // namespace rvlite
