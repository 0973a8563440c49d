// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_INTEGRITY_IMPL_HPP
#define VIGIL_INTEGRITY_IMPL_HPP

#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>

#include "integrity_interfaces.hpp"

namespace vigil {
namespace integrity {

/**
 * Default implementation of IFileSystem using std::filesystem
 */
class FileSystemImpl : public IFileSystem {
public:
  bool exists(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
  }

  bool is_regular_file(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
  }

  uint64_t file_size(const std::string& path, std::error_code& ec) const override {
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
      return 0;
    }
    return static_cast<uint64_t>(size);
  }

  bool remove(const std::string& path, std::error_code& ec) override {
    return std::filesystem::remove(path, ec);
  }

  void rename(const std::string& from, const std::string& to, std::error_code& ec) override {
    std::filesystem::rename(from, to, ec);
  }

  bool create_directories(const std::string& path, std::error_code& ec) override {
    return std::filesystem::create_directories(path, ec);
  }
};

/**
 * Adapts any std::istream to IFileStream without owning it
 */
class IstreamSource : public IFileStream {
public:
  explicit IstreamSource(std::istream& stream)
      : stream_(stream) {}

  IFileStream& read(char* buffer, std::streamsize size) override {
    stream_.read(buffer, size);
    return *this;
  }

  IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) override {
    stream_.seekg(offset, origin);
    return *this;
  }

  std::streamsize gcount() const override { return stream_.gcount(); }

  bool good() const override { return stream_.good(); }

  bool eof() const override { return stream_.eof(); }

  bool fail() const override { return stream_.fail(); }

  bool bad() const override { return stream_.bad(); }

  void clear() override { stream_.clear(); }

private:
  std::istream& stream_;
};

/**
 * Default implementation of IFileStream using std::ifstream
 */
class FileStreamImpl : public IstreamSource {
public:
  FileStreamImpl(const std::string& path, std::ios_base::openmode mode)
      : IstreamSource(file_)
      , file_(path, mode | std::ios::in) {}

  bool is_open() const { return file_.is_open(); }

private:
  // Constructed after the base, which only stores the reference
  std::ifstream file_;
};

/**
 * Default implementation of IOutputStream using std::ofstream
 */
class OutputStreamImpl : public IOutputStream {
public:
  OutputStreamImpl(const std::string& path, std::ios_base::openmode mode)
      : stream_(path, mode | std::ios::out | std::ios::trunc) {}

  bool write(const char* data, std::streamsize size) override {
    stream_.write(data, size);
    return stream_.good();
  }

  bool flush() override {
    stream_.flush();
    return stream_.good();
  }

  bool close() override {
    if (!stream_.is_open()) {
      return stream_.good();
    }
    stream_.close();
    return !stream_.fail();
  }

  bool good() const override { return stream_.good(); }

  bool is_open() const { return stream_.is_open(); }

private:
  std::ofstream stream_;
};

/**
 * Default implementation of IFileStreamFactory
 */
class FileStreamFactoryImpl : public IFileStreamFactory {
public:
  std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) override {
    auto stream = std::make_unique<FileStreamImpl>(path, mode);
    if (!stream->is_open() || !stream->good()) {
      return nullptr;
    }
    return stream;
  }

  std::unique_ptr<IOutputStream> create_output_stream(
    const std::string& path, std::ios_base::openmode mode
  ) override {
    auto stream = std::make_unique<OutputStreamImpl>(path, mode);
    if (!stream->is_open() || !stream->good()) {
      return nullptr;
    }
    return stream;
  }
};

}  // namespace integrity
}  // namespace vigil

#endif  // VIGIL_INTEGRITY_IMPL_HPP
