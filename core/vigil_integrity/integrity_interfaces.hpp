// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_INTEGRITY_INTERFACES_HPP
#define VIGIL_INTEGRITY_INTERFACES_HPP

#include <cstddef>
#include <cstdint>
#include <ios>
#include <memory>
#include <string>
#include <system_error>

namespace vigil {
namespace integrity {

/**
 * Interface for filesystem operations
 * Allows mocking filesystem operations for testing
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  virtual bool exists(const std::string& path) const = 0;

  virtual bool is_regular_file(const std::string& path) const = 0;

  /**
   * Get the size of a file in bytes
   * @param ec Set on failure, cleared on success
   */
  virtual uint64_t file_size(const std::string& path, std::error_code& ec) const = 0;

  /**
   * Remove a file. Removing a missing file is not an error.
   */
  virtual bool remove(const std::string& path, std::error_code& ec) = 0;

  /**
   * Atomically rename within one filesystem, replacing any existing target.
   */
  virtual void rename(const std::string& from, const std::string& to, std::error_code& ec) = 0;

  virtual bool create_directories(const std::string& path, std::error_code& ec) = 0;
};

/**
 * Interface for readable byte streams
 * Implemented over files, arbitrary std::istream sources and test mocks
 */
class IFileStream {
public:
  virtual ~IFileStream() = default;

  /**
   * Read up to `size` bytes. gcount() reports how many arrived.
   */
  virtual IFileStream& read(char* buffer, std::streamsize size) = 0;

  /**
   * Seek to a position. Not every source supports seeking.
   */
  virtual IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) = 0;

  virtual std::streamsize gcount() const = 0;

  virtual bool good() const = 0;

  virtual bool eof() const = 0;

  virtual bool fail() const = 0;

  virtual bool bad() const = 0;

  /**
   * Clear error state flags, e.g. after a short read hit end-of-file
   */
  virtual void clear() = 0;
};

/**
 * Interface for writable byte sinks (quarantine files)
 */
class IOutputStream {
public:
  virtual ~IOutputStream() = default;

  /**
   * Write `size` bytes. Returns false if the sink is no longer good.
   */
  virtual bool write(const char* data, std::streamsize size) = 0;

  virtual bool flush() = 0;

  /**
   * Close the sink. Returns false if buffered data could not be written.
   */
  virtual bool close() = 0;

  virtual bool good() const = 0;
};

/**
 * Factory interface for creating file streams
 * Allows mocking file stream creation for testing
 */
class IFileStreamFactory {
public:
  virtual ~IFileStreamFactory() = default;

  /**
   * Open a file for reading
   * @return Stream, or nullptr if the file could not be opened
   */
  virtual std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) = 0;

  /**
   * Create (truncate) a file for writing
   * @return Stream, or nullptr if the file could not be created
   */
  virtual std::unique_ptr<IOutputStream> create_output_stream(
    const std::string& path, std::ios_base::openmode mode
  ) = 0;
};

}  // namespace integrity
}  // namespace vigil

#endif  // VIGIL_INTEGRITY_INTERFACES_HPP
