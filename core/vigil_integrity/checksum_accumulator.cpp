// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "checksum_accumulator.hpp"

#include <cstdio>

namespace vigil {
namespace integrity {

ChecksumAccumulator& ChecksumAccumulator::update(const void* data, std::size_t size) {
  if (size == 0) {
    return *this;
  }
  crc_.process_bytes(data, size);
  bytes_ += size;
  return *this;
}

uint32_t ChecksumAccumulator::finalize() const {
  return static_cast<uint32_t>(crc_.checksum());
}

uint32_t ChecksumAccumulator::compute(const void* data, std::size_t size) {
  boost::crc_32_type crc;
  crc.process_bytes(data, size);
  return static_cast<uint32_t>(crc.checksum());
}

std::string crc_to_hex(uint32_t crc) {
  char buf[9];
  snprintf(buf, sizeof(buf), "%08x", crc);
  return std::string(buf);
}

}  // namespace integrity
}  // namespace vigil
