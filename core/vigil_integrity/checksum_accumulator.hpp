// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_CHECKSUM_ACCUMULATOR_HPP
#define VIGIL_CHECKSUM_ACCUMULATOR_HPP

#include <boost/crc.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace vigil {
namespace integrity {

/**
 * Running CRC-32 (IEEE 802.3, reflected, init/xorout 0xFFFFFFFF) over a
 * sequence of chunks.
 *
 * Chunk boundaries are invisible: feeding "ab" then "cd" yields the same
 * value as feeding "abcd" once. One accumulator belongs to exactly one
 * validation; create a fresh one per file or stream.
 */
class ChecksumAccumulator {
public:
  ChecksumAccumulator() = default;

  /**
   * Fold a chunk into the running state. Empty chunks leave it unchanged.
   *
   * @return *this, so updates can be chained
   */
  ChecksumAccumulator& update(const void* data, std::size_t size);

  ChecksumAccumulator& update(const std::string& chunk) {
    return update(chunk.data(), chunk.size());
  }

  /**
   * Final checksum of everything fed so far. Does not reset the state.
   */
  uint32_t finalize() const;

  /**
   * Total bytes fed so far.
   */
  uint64_t bytes() const {
    return bytes_;
  }

  /**
   * One-shot checksum of a contiguous buffer.
   */
  static uint32_t compute(const void* data, std::size_t size);

  static uint32_t compute(const std::string& data) {
    return compute(data.data(), data.size());
  }

private:
  boost::crc_32_type crc_;
  uint64_t bytes_ = 0;
};

/**
 * Format a CRC as 8 lower-case hex digits, e.g. "0a1b2c3d".
 */
std::string crc_to_hex(uint32_t crc);

}  // namespace integrity
}  // namespace vigil

#endif  // VIGIL_CHECKSUM_ACCUMULATOR_HPP
