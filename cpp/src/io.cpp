// src/io.cpp
#include "hashchain/io.hpp"
#include "hashchain/input.hpp"

#include <cstdio>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hashchain {
namespace {

std::vector<std::uint8_t> read_file(const std::string &path) {
  std::FILE *f = std::fopen(path.c_str(), "rb");
  if (!f)
    throw std::runtime_error("cannot open input file: " + path);

  std::vector<std::uint8_t> out;
  unsigned char buf[4096];
  std::size_t got;
  while ((got = std::fread(buf, 1, sizeof(buf), f)) > 0)
    out.insert(out.end(), buf, buf + got);
  const bool failed = std::ferror(f) != 0;
  std::fclose(f);
  if (failed)
    throw std::runtime_error("read failed: " + path);
  return out;
}

} // namespace

std::vector<std::uint8_t> FileSource::read() { return read_file(path_); }

std::vector<std::uint8_t> SplitFileSource::read() {
  std::vector<std::uint8_t> out = read_file(public_path_);
  // A short count would pull seed bytes into n.
  if (out.size() < kCountSize)
    throw MalformedInput(out.size());
  out.resize(kCountSize);
  std::vector<std::uint8_t> priv = read_file(private_path_);
  out.insert(out.end(), priv.begin(), priv.end());
  return out;
}

void TextSink::write(std::size_t index, std::uint32_t value) {
  char line[32];
  std::snprintf(line, sizeof(line), "public %zu: 0x%08x\n", index,
                static_cast<unsigned>(value));
  os_ << line;
}

void emit_words(const OutputWords &w, OutputSink &sink) {
  for (std::size_t i = 0; i < w.size(); ++i)
    sink.write(i, w[i]);
}

ChainResult evaluate(ByteSource &src, OutputSink &sink, ProgressCb cb,
                     std::uint64_t progress_stride) {
  const std::vector<std::uint8_t> buf = src.read();
  const ChainInput in = decode_input(buf); // throws before any hashing

  ChainConfig cfg;
  cfg.n = in.n;
  cfg.seed = in.seed;
  cfg.enable_progress = static_cast<bool>(cb);
  cfg.progress_stride = progress_stride;

  ChainResult res = run_chain(cfg, std::move(cb));
  emit_words(res.words, sink);
  return res;
}

} // namespace hashchain
