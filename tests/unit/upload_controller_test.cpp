#include "core/UploadController.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace fs = std::filesystem;

using chunkstitch::Config;
using chunkstitch::core::ChunkDeclaration;
using chunkstitch::core::IntegrityError;
using chunkstitch::core::StorageError;
using chunkstitch::core::UploadController;
using chunkstitch::core::UploadOutcome;
using chunkstitch::core::ValidationError;

struct Sandbox {
  fs::path root;
  Config config;

  explicit Sandbox(const std::string& tag, bool autoCleanup = true) {
    std::random_device rd;
    root = fs::temp_directory_path() / ("chunkstitch_" + tag + "_" + std::to_string(rd()));
    fs::remove_all(root);
    config.tempDir = (root / "temp_chunks").string();
    config.uploadsDir = (root / "uploads").string();
    config.autoCleanup = autoCleanup;
  }

  ~Sandbox() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  size_t chunkFiles() const { return CountFiles(config.tempDir); }
  size_t artifacts() const { return CountFiles(config.uploadsDir); }

  static size_t CountFiles(const fs::path& dir) {
    if (!fs::exists(dir)) return 0;
    return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
  }
};

std::vector<uint8_t> Bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::vector<std::string> ChunkContents(const fs::path& dir) {
  std::vector<std::string> contents;
  for (const auto& entry : fs::directory_iterator(dir)) {
    contents.push_back(ReadFile(entry.path().string()));
  }
  return contents;
}

// Hands out a few bytes, then fails like a dropped connection
class BrokenPayload : public std::streambuf {
public:
  explicit BrokenPayload(std::string prefix) : prefix_(std::move(prefix)) {
    setg(&prefix_[0], &prefix_[0], &prefix_[0] + prefix_.size());
  }

protected:
  int_type underflow() override { throw std::runtime_error("connection reset"); }

private:
  std::string prefix_;
};

ChunkDeclaration Declare(const std::string& identity, size_t index, size_t total, uint64_t size) {
  ChunkDeclaration declaration;
  declaration.identity = identity;
  declaration.chunkIndex = index;
  declaration.totalChunks = total;
  declaration.expectedSize = size;
  return declaration;
}

void TestSingleChunkUploadCompletes() {
  Sandbox sandbox("ctl_single");
  UploadController controller(sandbox.config);

  const auto outcome = controller.submitChunk(Declare("test.txt", 0, 1, 13), Bytes("Hello, World!"));

  assert(outcome.kind == UploadOutcome::Kind::UploadComplete);
  assert(outcome.artifact.has_value());
  assert(outcome.artifact->originalName == "test.txt");
  assert(outcome.artifact->fileSize == 13);
  assert(outcome.artifact->mimeType == "text/plain");
  assert(ReadFile(outcome.artifact->path) == "Hello, World!");
}

void TestTwoChunksInEitherOrder() {
  for (bool reversed : {false, true}) {
    Sandbox sandbox(reversed ? "ctl_reversed" : "ctl_ordered");
    UploadController controller(sandbox.config);

    const auto first = Declare("test.txt", reversed ? 1 : 0, 2, 13);
    const auto second = Declare("test.txt", reversed ? 0 : 1, 2, 13);
    const auto firstPayload = Bytes(reversed ? "World!" : "Hello, ");
    const auto secondPayload = Bytes(reversed ? "Hello, " : "World!");

    const auto accepted = controller.submitChunk(first, firstPayload);
    assert(accepted.kind == UploadOutcome::Kind::ChunkAccepted);
    assert(accepted.chunkIndex == first.chunkIndex);
    assert(accepted.totalChunks == 2);
    assert(accepted.receivedChunks == 1);

    const auto done = controller.submitChunk(second, secondPayload);
    assert(done.complete());
    assert(ReadFile(done.artifact->path) == "Hello, World!");
  }
}

void TestStreamPayload() {
  Sandbox sandbox("ctl_stream");
  UploadController controller(sandbox.config);

  std::istringstream stream("streamed bytes");
  const auto outcome = controller.submitChunk(Declare("s.bin", 0, 1, 14), stream);
  assert(outcome.complete());
  assert(ReadFile(outcome.artifact->path) == "streamed bytes");
  assert(outcome.artifact->mimeType == "application/octet-stream");
}

void TestStatusTracksProgress() {
  Sandbox sandbox("ctl_status");
  UploadController controller(sandbox.config);

  auto unknown = controller.status("nothing.bin");
  assert(!unknown.exists);
  assert(!unknown.complete);
  assert(unknown.receivedChunks == 0);

  controller.submitChunk(Declare("big.bin", 0, 4, 4), Bytes("a"));
  controller.submitChunk(Declare("big.bin", 3, 4, 4), Bytes("d"));

  auto status = controller.status("big.bin");
  assert(status.exists);
  assert(!status.complete);
  assert(status.receivedChunks == 2);
  assert(status.totalChunks == 4);
}

void TestAutoCleanupPurgesChunksAndEntry() {
  Sandbox sandbox("ctl_autoclean");
  UploadController controller(sandbox.config);

  controller.submitChunk(Declare("clean.txt", 0, 2, 6), Bytes("abc"));
  assert(sandbox.chunkFiles() == 1);

  const auto outcome = controller.submitChunk(Declare("clean.txt", 1, 2, 6), Bytes("def"));
  assert(outcome.complete());

  assert(sandbox.chunkFiles() == 0);
  assert(sandbox.artifacts() == 1);
  auto status = controller.status("clean.txt");
  assert(!status.exists);
  assert(status.receivedChunks == 0);
}

void TestDeferredCleanupKeepsChunksUntilCleanup() {
  Sandbox sandbox("ctl_deferred", false);
  UploadController controller(sandbox.config);

  controller.submitChunk(Declare("keep.txt", 0, 2, 6), Bytes("abc"));
  const auto outcome = controller.submitChunk(Declare("keep.txt", 1, 2, 6), Bytes("def"));
  assert(outcome.complete());

  assert(sandbox.chunkFiles() == 2);
  auto status = controller.status("keep.txt");
  assert(status.exists);
  assert(status.complete);
  assert(status.receivedChunks == 2);

  // Already stitched: the resend is accepted but the recorded bytes stay
  const auto resent = controller.submitChunk(Declare("keep.txt", 1, 2, 6), Bytes("XYZ"));
  assert(!resent.complete());
  assert(resent.receivedChunks == 2);
  assert(sandbox.artifacts() == 1);
  assert(sandbox.chunkFiles() == 2);
  const auto contents = ChunkContents(sandbox.config.tempDir);
  assert(std::count(contents.begin(), contents.end(), "def") == 1);
  assert(std::count(contents.begin(), contents.end(), "XYZ") == 0);

  controller.cleanup("keep.txt");
  assert(sandbox.chunkFiles() == 0);
  assert(!controller.status("keep.txt").exists);
  assert(sandbox.artifacts() == 1);
}

void TestDuplicateChunkOverwrites() {
  Sandbox sandbox("ctl_duplicate");
  UploadController controller(sandbox.config);

  controller.submitChunk(Declare("dup.txt", 0, 2, 6), Bytes("xyz"));
  const auto again = controller.submitChunk(Declare("dup.txt", 0, 2, 6), Bytes("abc"));
  assert(!again.complete());
  assert(again.receivedChunks == 1);

  // The replaced version is gone
  assert(sandbox.chunkFiles() == 1);

  const auto done = controller.submitChunk(Declare("dup.txt", 1, 2, 6), Bytes("def"));
  assert(done.complete());
  assert(ReadFile(done.artifact->path) == "abcdef");
}

void TestFailedResendKeepsRecordedChunk() {
  Sandbox sandbox("ctl_failed_resend");
  UploadController controller(sandbox.config);

  controller.submitChunk(Declare("f.txt", 0, 2, 13), Bytes("Hello, "));

  BrokenPayload buffer("Hell");
  std::istream broken(&buffer);
  bool threw = false;
  try {
    controller.submitChunk(Declare("f.txt", 0, 2, 13), broken);
  } catch (const StorageError&) {
    threw = true;
  }
  assert(threw);

  const auto status = controller.status("f.txt");
  assert(status.receivedChunks == 1);
  assert(sandbox.chunkFiles() == 1);
  assert(ChunkContents(sandbox.config.tempDir).front() == "Hello, ");

  const auto done = controller.submitChunk(Declare("f.txt", 1, 2, 13), Bytes("World!"));
  assert(done.complete());
  assert(ReadFile(done.artifact->path) == "Hello, World!");
}

void TestConflictingFirstChunksLeaveWinnerBytes() {
  Sandbox sandbox("ctl_first_race");
  UploadController controller(sandbox.config);

  // Every writer declares chunk 0 of a different slot count; one entry wins
  const size_t writers = 8;
  std::atomic<int> accepted{0};
  std::atomic<int> rejected{0};

  std::vector<std::thread> workers;
  for (size_t w = 0; w < writers; ++w) {
    workers.emplace_back([&, w] {
      const size_t total = w + 2;
      try {
        controller.submitChunk(Declare("race.bin", 0, total, 100), Bytes("total=" + std::to_string(total)));
        ++accepted;
      } catch (const ValidationError&) {
        ++rejected;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(accepted.load() == 1);
  assert(rejected.load() == static_cast<int>(writers - 1));

  const auto status = controller.status("race.bin");
  assert(status.receivedChunks == 1);
  assert(sandbox.chunkFiles() == 1);
  assert(ChunkContents(sandbox.config.tempDir).front() == "total=" + std::to_string(status.totalChunks));
}

void TestSizeMismatchLeavesNoArtifactAndKeepsEntry() {
  Sandbox sandbox("ctl_mismatch");
  UploadController controller(sandbox.config);

  controller.submitChunk(Declare("bad.txt", 0, 2, 100), Bytes("Hello, "));

  bool threw = false;
  try {
    controller.submitChunk(Declare("bad.txt", 1, 2, 100), Bytes("World!"));
  } catch (const IntegrityError& e) {
    threw = true;
    assert(e.expected() == 100);
    assert(e.actual() == 13);
  }
  assert(threw);
  assert(sandbox.artifacts() == 0);

  // Progress is untouched; resending a chunk retries the assembly
  auto status = controller.status("bad.txt");
  assert(status.exists);
  assert(status.complete);
  assert(sandbox.chunkFiles() == 2);

  threw = false;
  try {
    controller.submitChunk(Declare("bad.txt", 1, 2, 100), Bytes("World!"));
  } catch (const IntegrityError&) {
    threw = true;
  }
  assert(threw);

  controller.cleanup("bad.txt");
  assert(sandbox.chunkFiles() == 0);
}

void TestInvalidDeclarationsAreRejectedBeforeWriting() {
  Sandbox sandbox("ctl_invalid");
  UploadController controller(sandbox.config);

  auto rejects = [&](const ChunkDeclaration& declaration) {
    try {
      controller.submitChunk(declaration, Bytes("x"));
    } catch (const ValidationError&) {
      return true;
    }
    return false;
  };

  assert(rejects(Declare("", 0, 1, 1)));
  assert(rejects(Declare("a.bin", 0, 0, 1)));
  assert(rejects(Declare("a.bin", 3, 3, 1)));
  assert(sandbox.chunkFiles() == 0);

  controller.submitChunk(Declare("a.bin", 0, 3, 3), Bytes("k"));
  // A conflicting chunk 0 must not replace the recorded one
  assert(rejects(Declare("a.bin", 0, 5, 3)));
  assert(rejects(Declare("a.bin", 0, 3, 4)));

  controller.submitChunk(Declare("a.bin", 1, 3, 3), Bytes("e"));
  const auto done = controller.submitChunk(Declare("a.bin", 2, 3, 3), Bytes("y"));
  assert(ReadFile(done.artifact->path) == "key");
}

void TestCleanupAbandonsUploadInProgress() {
  Sandbox sandbox("ctl_abandon");
  UploadController controller(sandbox.config);

  controller.submitChunk(Declare("gone.bin", 0, 3, 3), Bytes("a"));
  controller.submitChunk(Declare("gone.bin", 1, 3, 3), Bytes("b"));

  controller.cleanup("gone.bin");
  assert(sandbox.chunkFiles() == 0);
  assert(!controller.status("gone.bin").exists);

  // Unknown identities are fine too
  controller.cleanup("never-started");
}

void TestConcurrentChunksCompleteExactlyOnce() {
  Sandbox sandbox("ctl_concurrent");
  UploadController controller(sandbox.config);

  const size_t total = 32;
  std::string expected;
  std::vector<std::string> payloads;
  for (size_t i = 0; i < total; ++i) {
    payloads.push_back("chunk-" + std::to_string(i) + ";");
    expected += payloads.back();
  }

  std::atomic<int> completes{0};
  std::atomic<int> accepted{0};
  std::mutex resultMutex;
  std::string artifactPath;

  std::vector<std::thread> workers;
  for (size_t i = 0; i < total; ++i) {
    workers.emplace_back([&, i] {
      const auto outcome = controller.submitChunk(Declare("parallel.log", i, total, expected.size()), Bytes(payloads[i]));
      if (outcome.complete()) {
        ++completes;
        std::lock_guard<std::mutex> lock(resultMutex);
        artifactPath = outcome.artifact->path;
      } else {
        ++accepted;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(completes.load() == 1);
  assert(accepted.load() == static_cast<int>(total - 1));
  assert(ReadFile(artifactPath) == expected);
  assert(sandbox.artifacts() == 1);
  assert(sandbox.chunkFiles() == 0);
}

void TestConcurrentUploadsStayIsolated() {
  Sandbox sandbox("ctl_isolated");
  UploadController controller(sandbox.config);

  const size_t uploads = 6;
  const size_t chunks = 5;
  std::atomic<int> completes{0};

  std::vector<std::thread> workers;
  for (size_t u = 0; u < uploads; ++u) {
    for (size_t c = 0; c < chunks; ++c) {
      workers.emplace_back([&, u, c] {
        const std::string name = "file-" + std::to_string(u) + ".txt";
        const auto outcome = controller.submitChunk(Declare(name, c, chunks, chunks * 2),
                                                    Bytes(std::to_string(u) + std::to_string(c)));
        if (outcome.complete()) {
          assert(ReadFile(outcome.artifact->path) ==
                 std::to_string(u) + "0" + std::to_string(u) + "1" + std::to_string(u) + "2" +
                 std::to_string(u) + "3" + std::to_string(u) + "4");
          ++completes;
        }
      });
    }
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(completes.load() == static_cast<int>(uploads));
  assert(sandbox.artifacts() == uploads);
}

} // namespace

int main() {
  TestSingleChunkUploadCompletes();
  TestTwoChunksInEitherOrder();
  TestStreamPayload();
  TestStatusTracksProgress();
  TestAutoCleanupPurgesChunksAndEntry();
  TestDeferredCleanupKeepsChunksUntilCleanup();
  TestDuplicateChunkOverwrites();
  TestFailedResendKeepsRecordedChunk();
  TestConflictingFirstChunksLeaveWinnerBytes();
  TestSizeMismatchLeavesNoArtifactAndKeepsEntry();
  TestInvalidDeclarationsAreRejectedBeforeWriting();
  TestCleanupAbandonsUploadInProgress();
  TestConcurrentChunksCompleteExactlyOnce();
  TestConcurrentUploadsStayIsolated();

  std::cout << "chunkstitch_unit_upload_controller: pass\n";
  return 0;
}
