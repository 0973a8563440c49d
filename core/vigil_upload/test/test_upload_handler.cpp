// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for UploadHandler
 *
 * Real-filesystem tests cover the end-to-end pipeline; the mocked filesystem
 * injects failures (rename, directory creation) that real files cannot.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "checksum_accumulator.hpp"
#include "integrity_impl.hpp"
#include "integrity_mocks.hpp"
#include "upload_handler.hpp"
#include "upload_json.hpp"

namespace fs = std::filesystem;
using namespace vigil::upload;
using vigil::integrity::ChecksumAccumulator;
using vigil::integrity::CancellationToken;
using vigil::integrity::ErrorCode;
using vigil::integrity::FileStreamFactoryImpl;
using vigil::integrity::IstreamSource;
using vigil::integrity::test::MockFileSystem;
using vigil::integrity::test::ScriptedStream;
using ::testing::_;
using ::testing::Return;

class UploadHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = (fs::temp_directory_path() /
             ("vigil_upload_test_" +
              std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
              .string();
    config_.destination_dir = root_ + "/artifacts";
    config_.quarantine_dir = root_ + "/quarantine";
    config_.integrity.chunk_size_bytes = 1024;
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  static std::string pattern(size_t size) {
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i) {
      data[i] = static_cast<char>((i * 131) & 0xFF);
    }
    return data;
  }

  static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
  }

  size_t quarantine_entries() const {
    if (!fs::exists(config_.quarantine_dir)) {
      return 0;
    }
    return static_cast<size_t>(std::distance(
      fs::directory_iterator(config_.quarantine_dir), fs::directory_iterator()
    ));
  }

  static UploadRequest request(const std::string& name) {
    UploadRequest req;
    req.declared_filename = name;
    return req;
  }

  std::string root_;
  UploadConfig config_;
};

TEST_F(UploadHandlerTest, RoundTripMatchesOutOfBandChecksum) {
  std::string content = pattern(5000);
  std::istringstream input(content);
  IstreamSource source(input);

  UploadHandler handler(config_);
  auto req = request("my-package-1.2.3.tgz");
  req.declared_size = content.size();
  auto outcome = handler.handle_upload(source, req);

  ASSERT_TRUE(outcome) << outcome.error.describe();
  EXPECT_EQ(outcome.final_state, UploadState::PROMOTED);
  EXPECT_EQ(outcome.result.path, config_.destination_dir + "/my-package-1.2.3.tgz");
  EXPECT_EQ(outcome.result.integrity.algorithm, "crc32");
  EXPECT_EQ(outcome.result.bytes, content.size());

  std::string stored = read_file(outcome.result.path);
  EXPECT_EQ(stored, content);
  EXPECT_EQ(outcome.result.integrity.crc32, ChecksumAccumulator::compute(stored));
  EXPECT_EQ(quarantine_entries(), 0u);

  EXPECT_EQ(handler.stats().uploads_completed.load(), 1u);
  EXPECT_EQ(handler.stats().uploads_active.load(), 0u);
  EXPECT_EQ(handler.stats().bytes_received.load(), content.size());
}

TEST_F(UploadHandlerTest, StateSequenceReported) {
  std::istringstream input("abc");
  IstreamSource source(input);
  std::vector<UploadState> states;

  UploadHandler handler(config_);
  auto outcome = handler.handle_upload(source, request("abc.txt"), nullptr, [&](UploadState, UploadState to) {
    states.push_back(to);
  });

  ASSERT_TRUE(outcome);
  std::vector<UploadState> expected = {
    UploadState::FILENAME_VALIDATED, UploadState::QUARANTINED, UploadState::VALIDATED,
    UploadState::PROMOTED
  };
  EXPECT_EQ(states, expected);
}

TEST_F(UploadHandlerTest, SizeMismatchLeavesNothingBehind) {
  std::istringstream input(pattern(100));
  IstreamSource source(input);

  UploadHandler handler(config_);
  auto req = request("short.tgz");
  req.declared_size = 200;
  auto outcome = handler.handle_upload(source, req);

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.final_state, UploadState::REJECTED);
  EXPECT_EQ(outcome.error.code, ErrorCode::SizeMismatch);
  EXPECT_EQ(outcome.error.expected_size, 200u);
  EXPECT_EQ(outcome.error.actual_size, 100u);
  EXPECT_EQ(outcome.error.source, "short.tgz");
  EXPECT_FALSE(fs::exists(config_.destination_dir + "/short.tgz"));
  EXPECT_EQ(quarantine_entries(), 0u);
  EXPECT_EQ(handler.stats().uploads_rejected.load(), 1u);
}

TEST_F(UploadHandlerTest, ChecksumMismatchRejected) {
  std::istringstream input("payload");
  IstreamSource source(input);

  UploadHandler handler(config_);
  auto req = request("payload.bin");
  req.expected_crc32 = ChecksumAccumulator::compute("payload") ^ 0xFFu;
  auto outcome = handler.handle_upload(source, req);

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error.code, ErrorCode::ChecksumMismatch);
  EXPECT_FALSE(fs::exists(config_.destination_dir + "/payload.bin"));
  EXPECT_EQ(quarantine_entries(), 0u);
}

TEST_F(UploadHandlerTest, BadFilenameRejectedBeforeAnyWrite) {
  std::istringstream input("data");
  IstreamSource source(input);

  UploadHandler handler(config_);
  auto outcome = handler.handle_upload(source, request("../../etc/passwd"));

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error.code, ErrorCode::FilenameRejected);
  EXPECT_EQ(outcome.error.rule, "path_traversal");
  EXPECT_FALSE(fs::exists(config_.quarantine_dir));
  EXPECT_EQ(static_cast<std::streamoff>(input.tellg()), 0);
}

TEST_F(UploadHandlerTest, EmptyStreamRejected) {
  std::istringstream input("");
  IstreamSource source(input);

  UploadHandler handler(config_);
  auto outcome = handler.handle_upload(source, request("empty.tgz"));

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error.code, ErrorCode::EmptyFile);
  EXPECT_EQ(quarantine_entries(), 0u);
}

TEST_F(UploadHandlerTest, CancelledUploadCleansUp) {
  ScriptedStream stream(pattern(10000));
  CancellationToken token;
  token.cancel();

  UploadHandler handler(config_);
  auto outcome = handler.handle_upload(stream, request("big.tgz"), &token);

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error.code, ErrorCode::Cancelled);
  EXPECT_FALSE(fs::exists(config_.destination_dir + "/big.tgz"));
  EXPECT_EQ(quarantine_entries(), 0u);
}

TEST_F(UploadHandlerTest, ReadFailureCleansUp) {
  ScriptedStream stream(pattern(10000), 4096);

  UploadHandler handler(config_);
  auto outcome = handler.handle_upload(stream, request("broken.tgz"));

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error.code, ErrorCode::ReadFailure);
  EXPECT_EQ(outcome.error.source, "broken.tgz");
  EXPECT_EQ(quarantine_entries(), 0u);
}

TEST_F(UploadHandlerTest, ContentTypeAllowList) {
  config_.allowed_content_types = {"application/gzip"};
  UploadHandler handler(config_);

  std::istringstream bad_input("x");
  IstreamSource bad_source(bad_input);
  auto req = request("a.tgz");
  req.content_type = "text/html";
  auto rejected = handler.handle_upload(bad_source, req);
  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.error.code, ErrorCode::InvalidArgument);

  std::istringstream good_input("x");
  IstreamSource good_source(good_input);
  req.content_type = "application/gzip";
  EXPECT_TRUE(handler.handle_upload(good_source, req));
}

TEST_F(UploadHandlerTest, ConcurrentUploadsDoNotCollide) {
  UploadHandler handler(config_);
  constexpr int kUploads = 16;
  std::vector<std::string> contents;
  for (int i = 0; i < kUploads; ++i) {
    contents.push_back(pattern(3000 + i * 17));
  }

  std::vector<UploadOutcome> outcomes(kUploads, UploadOutcome::failure({}));
  std::vector<std::thread> threads;
  for (int i = 0; i < kUploads; ++i) {
    threads.emplace_back([&, i]() {
      std::istringstream input(contents[i]);
      IstreamSource source(input);
      outcomes[i] = handler.handle_upload(source, request("pkg-" + std::to_string(i) + ".tgz"));
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  for (int i = 0; i < kUploads; ++i) {
    ASSERT_TRUE(outcomes[i]) << i << ": " << outcomes[i].error.describe();
    EXPECT_EQ(read_file(outcomes[i].result.path), contents[i]);
    EXPECT_EQ(outcomes[i].result.integrity.crc32, ChecksumAccumulator::compute(contents[i]));
  }
  EXPECT_EQ(handler.stats().uploads_completed.load(), static_cast<uint64_t>(kUploads));
  EXPECT_EQ(quarantine_entries(), 0u);
}

TEST_F(UploadHandlerTest, VerifyPromotedArtifact) {
  std::istringstream input("verified artifact");
  IstreamSource source(input);

  UploadHandler handler(config_);
  auto outcome = handler.handle_upload(source, request("artifact.bin"));
  ASSERT_TRUE(outcome);

  EXPECT_TRUE(handler.verify(outcome.result.path, outcome.result.integrity.crc32));

  auto tampered = handler.verify(outcome.result.path, outcome.result.integrity.crc32 + 1);
  EXPECT_FALSE(tampered);
  EXPECT_EQ(tampered.error.code, ErrorCode::ChecksumMismatch);
}

TEST_F(UploadHandlerTest, UploadFromLocalFile) {
  fs::create_directories(root_);
  std::string source_path = root_ + "/source.bin";
  {
    std::ofstream out(source_path, std::ios::binary);
    out << "local file bytes";
  }

  UploadHandler handler(config_);
  auto outcome = handler.handle_upload_file(source_path, request("copy.bin"));
  ASSERT_TRUE(outcome);
  EXPECT_EQ(read_file(outcome.result.path), "local file bytes");

  auto missing = handler.handle_upload_file(root_ + "/none.bin", request("none.bin"));
  EXPECT_FALSE(missing);
  EXPECT_EQ(missing.error.code, ErrorCode::NotFound);
}

namespace {

// Real files, with a running count of the bytes written to quarantine
class CountingStreamFactory : public vigil::integrity::IFileStreamFactory {
public:
  std::unique_ptr<vigil::integrity::IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) override {
    return real_.create_file_stream(path, mode);
  }

  std::unique_ptr<vigil::integrity::IOutputStream> create_output_stream(
    const std::string& path, std::ios_base::openmode mode
  ) override {
    auto inner = real_.create_output_stream(path, mode);
    if (!inner) {
      return nullptr;
    }
    return std::make_unique<Counting>(std::move(inner), written);
  }

  uint64_t written = 0;

private:
  class Counting : public vigil::integrity::IOutputStream {
  public:
    Counting(std::unique_ptr<vigil::integrity::IOutputStream> inner, uint64_t& written)
        : inner_(std::move(inner))
        , written_(written) {}

    bool write(const char* data, std::streamsize size) override {
      written_ += static_cast<uint64_t>(size);
      return inner_->write(data, size);
    }
    bool flush() override { return inner_->flush(); }
    bool close() override { return inner_->close(); }
    bool good() const override { return inner_->good(); }

  private:
    std::unique_ptr<vigil::integrity::IOutputStream> inner_;
    uint64_t& written_;
  };

  FileStreamFactoryImpl real_;
};

}  // namespace

TEST_F(UploadHandlerTest, OversizedBodyStopsAtDeclaredSize) {
  auto factory = std::make_shared<CountingStreamFactory>();
  UploadHandler handler(
    config_, std::make_shared<vigil::integrity::FileSystemImpl>(), factory
  );

  ScriptedStream stream(pattern(8 * 1024 * 1024));
  auto req = request("bomb.tgz");
  req.declared_size = 10;
  auto outcome = handler.handle_upload(stream, req);

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.final_state, UploadState::REJECTED);
  EXPECT_EQ(outcome.error.code, ErrorCode::SizeMismatch);
  EXPECT_EQ(outcome.error.expected_size, 10u);
  EXPECT_GT(outcome.error.actual_size, 10u);
  EXPECT_LE(factory->written, 10u);
  EXPECT_LE(stream.reads(), 1);
  EXPECT_EQ(quarantine_entries(), 0u);
  EXPECT_FALSE(fs::exists(config_.destination_dir + "/bomb.tgz"));
}

// =============================================================================
// Injected filesystem failures
// =============================================================================

class UploadHandlerMockedTest : public UploadHandlerTest {
protected:
  void SetUp() override {
    UploadHandlerTest::SetUp();
    // Real files for writing, mocked namespace operations
    fs::create_directories(config_.quarantine_dir);
    fs::create_directories(config_.destination_dir);
    filesystem_ = std::make_shared<MockFileSystem>();
    ON_CALL(*filesystem_, create_directories(_, _)).WillByDefault(Return(false));
  }

  std::shared_ptr<MockFileSystem> filesystem_;
};

TEST_F(UploadHandlerMockedTest, RenameFailureRejectsAndCleansUp) {
  EXPECT_CALL(*filesystem_, create_directories(_, _)).Times(2);
  EXPECT_CALL(*filesystem_, rename(_, _, _))
    .WillOnce([](const std::string&, const std::string&, std::error_code& ec) {
      ec = std::make_error_code(std::errc::cross_device_link);
    });
  std::string removed;
  EXPECT_CALL(*filesystem_, remove(_, _))
    .WillOnce([&removed](const std::string& path, std::error_code& ec) {
      removed = path;
      return fs::remove(path, ec);
    });

  UploadHandler handler(config_, filesystem_, std::make_shared<FileStreamFactoryImpl>());
  std::istringstream input("bytes");
  IstreamSource source(input);
  auto outcome = handler.handle_upload(source, request("x.tgz"));

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error.code, ErrorCode::WriteFailure);
  EXPECT_EQ(outcome.error.message, "Promotion failed");
  EXPECT_EQ(removed.rfind(config_.quarantine_dir + "/.x.tgz.", 0), 0u);
  EXPECT_FALSE(fs::exists(removed));
  EXPECT_FALSE(fs::exists(config_.destination_dir + "/x.tgz"));
}

TEST_F(UploadHandlerMockedTest, DirectoryCreationFailure) {
  EXPECT_CALL(*filesystem_, create_directories(_, _))
    .WillOnce([](const std::string&, std::error_code& ec) {
      ec = std::make_error_code(std::errc::read_only_file_system);
      return false;
    });
  EXPECT_CALL(*filesystem_, rename(_, _, _)).Times(0);

  UploadHandler handler(config_, filesystem_, std::make_shared<FileStreamFactoryImpl>());
  std::istringstream input("bytes");
  IstreamSource source(input);
  auto outcome = handler.handle_upload(source, request("x.tgz"));

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error.code, ErrorCode::WriteFailure);
  EXPECT_FALSE(outcome.error.cause.empty());
}

TEST_F(UploadHandlerMockedTest, CleanupFailureDoesNotMaskPrimaryError) {
  EXPECT_CALL(*filesystem_, create_directories(_, _)).Times(2);
  EXPECT_CALL(*filesystem_, remove(_, _))
    .WillOnce([](const std::string&, std::error_code& ec) {
      ec = std::make_error_code(std::errc::permission_denied);
      return false;
    });

  UploadHandler handler(config_, filesystem_, std::make_shared<FileStreamFactoryImpl>());
  std::istringstream input("0123456789");
  IstreamSource source(input);
  auto req = request("y.tgz");
  req.declared_size = 5;
  auto outcome = handler.handle_upload(source, req);

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error.code, ErrorCode::SizeMismatch);
}

// =============================================================================
// JSON
// =============================================================================

TEST_F(UploadHandlerTest, OutcomeSerializesToJson) {
  std::istringstream input("hello");
  IstreamSource source(input);
  UploadHandler handler(config_);

  nlohmann::json ok = handler.handle_upload(source, request("hello.txt"));
  EXPECT_TRUE(ok["valid"].get<bool>());
  EXPECT_EQ(ok["state"], "promoted");
  EXPECT_EQ(ok["result"]["bytes"], 5);
  EXPECT_EQ(ok["result"]["integrity"]["algorithm"], "crc32");
  EXPECT_EQ(ok["result"]["integrity"]["crc32_hex"], "3610a686");

  std::istringstream bad_input("hello");
  IstreamSource bad_source(bad_input);
  auto req = request("hello2.txt");
  req.declared_size = 6;
  nlohmann::json rejected = handler.handle_upload(bad_source, req);
  EXPECT_FALSE(rejected["valid"].get<bool>());
  EXPECT_EQ(rejected["state"], "rejected");
  EXPECT_EQ(rejected["error"]["code"], "size_mismatch");
  EXPECT_EQ(rejected["error"]["expected_size"], 6);
  EXPECT_EQ(rejected["error"]["actual_size"], 5);
  EXPECT_FALSE(rejected.contains("result"));
}
