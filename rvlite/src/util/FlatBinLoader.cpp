// **********************************************************************
// rvlite/src/util/FlatBinLoader.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026

#include "util/FlatBinLoader.hpp"
#include "Hart.hpp"

#include <fstream>
#include <iostream>
#include <iterator>

namespace rvlite {

bool read_flat_bin(const std::string& path, std::vector<uint8_t>* bytes) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "cannot open " << path << std::endl;
    return false;
  }
  bytes->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

bool load_flat_bin(const std::string& path, Hart* hart, uint32_t* nbytes) {
  std::vector<uint8_t> image;
  if (!read_flat_bin(path, &image)) return false;
  if (!hart->load_image(image)) {
    std::cerr << path << " (" << image.size() << " bytes) does not fit in "
              << hart->memory().size() << " bytes of memory" << std::endl;
    return false;
  }
  if (nbytes) *nbytes = static_cast<uint32_t>(image.size());
  return true;
}

} // namespace rvlite
