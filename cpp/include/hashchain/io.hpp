// include/hashchain/io.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>
#include "hashchain.hpp"

namespace hashchain {

// Where the raw input buffer comes from.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual std::vector<std::uint8_t> read() = 0;
};

// Combined layout in one file (input.bin).
class FileSource : public ByteSource {
public:
  explicit FileSource(std::string path) : path_(std::move(path)) {}
  std::vector<std::uint8_t> read() override;

private:
  std::string path_;
};

// Public count and private seed in separate files (public.bin / private.bin),
// concatenated into the combined layout.
class SplitFileSource : public ByteSource {
public:
  SplitFileSource(std::string public_path, std::string private_path)
      : public_path_(std::move(public_path)),
        private_path_(std::move(private_path)) {}
  std::vector<std::uint8_t> read() override;

private:
  std::string public_path_;
  std::string private_path_;
};

class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::vector<std::uint8_t> bytes)
      : bytes_(std::move(bytes)) {}
  std::vector<std::uint8_t> read() override { return bytes_; }

private:
  std::vector<std::uint8_t> bytes_;
};

// Where the public words go: an indexed channel 0..7.
class OutputSink {
public:
  virtual ~OutputSink() = default;
  virtual void write(std::size_t index, std::uint32_t value) = 0;
};

// "public <i>: 0x<8 hex digits>" per word.
class TextSink : public OutputSink {
public:
  explicit TextSink(std::ostream& os) : os_(os) {}
  void write(std::size_t index, std::uint32_t value) override;

private:
  std::ostream& os_;
};

class VectorSink : public OutputSink {
public:
  void write(std::size_t index, std::uint32_t value) override {
    entries.emplace_back(index, value);
  }
  std::vector<std::pair<std::size_t, std::uint32_t>> entries;
};

// Ordered writes, index 0..7.
void emit_words(const OutputWords& w, OutputSink& sink);

// decode -> chain -> encode -> emit. MalformedInput aborts before any hashing
// and before anything reaches the sink.
ChainResult evaluate(ByteSource& src, OutputSink& sink,
                     ProgressCb cb = {}, std::uint64_t progress_stride = 0);

} // namespace hashchain
