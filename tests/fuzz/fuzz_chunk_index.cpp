#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "zf/error.h"
#include "zf/format/segment_headers.h"
#include "zf/storage/segment_io.h"
#include "zf/storage/segment_reader.h"

// Treats the input as the data region of segment 1 and indexes it.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (data == nullptr) {
    return 0;
  }
  std::vector<std::vector<uint8_t>> segments{std::vector<uint8_t>(data, data + size)};
  auto sources = zf::storage::MemorySources(std::move(segments));
  const zf::format::SplitHeader first{1, 1, size};
  try {
    auto index = zf::storage::ChunkIndex::Build(sources, first, 0, false);
    for (const auto& location : index.chunks()) {
      (void)index.Find(location.header.chunk_number);
    }
  } catch (const zf::Error&) {
    return 0;
  }
  return 0;
}
