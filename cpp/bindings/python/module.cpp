#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <stdexcept>
#include <utility>

#include "hashchain/hashchain.hpp"
#include "hashchain/input.hpp"

namespace py = pybind11;

static py::bytes digest_to_bytes(const hashchain::Digest& d) {
  return py::bytes(reinterpret_cast<const char*>(d.bytes.data()), d.bytes.size());
}

static hashchain::Digest digest_from_bytes(const py::bytes& b) {
  std::string s = b;
  if (s.size() != hashchain::kSeedSize)
    throw std::invalid_argument("seed must be exactly 32 bytes");
  hashchain::Digest d;
  std::memcpy(d.bytes.data(), s.data(), s.size());
  return d;
}

static py::dict hash_chain_py(std::uint64_t n, const py::bytes& seed,
                              std::uint64_t progress_stride = 0,
                              std::optional<py::function> callback = std::nullopt) {

  hashchain::ChainConfig cfg;
  cfg.n = n;
  cfg.seed = digest_from_bytes(seed);
  cfg.enable_progress = callback.has_value();
  cfg.progress_stride = progress_stride;

  // Prepare C++ progress callback that reacquires the GIL when invoked.
  hashchain::ProgressCb cb_cpp;
  if (callback.has_value()) {
    py::function fn = *callback;
    cb_cpp = [fn = std::move(fn)](std::uint64_t iter, const hashchain::Digest& d) {
      py::gil_scoped_acquire gil;
      fn(iter, digest_to_bytes(d));
    };
  }

  // Release the GIL for the heavy computation.
  hashchain::ChainResult res;
  {
    py::gil_scoped_release nogil;
    res = hashchain::run_chain(cfg, cb_cpp);
  }

  py::list words;
  for (auto w : res.words) words.append(py::int_(w));

  py::dict out;
  out["n"] = py::int_(res.n);
  out["digest"] = digest_to_bytes(res.digest);
  out["words"] = words;
  out["ns_elapsed"] = py::int_(res.ns_elapsed);
  out["engine_info"] = res.engine_info;
  return out;
}

static py::tuple decode_input_py(const py::bytes& data) {
  std::string s = data;
  auto in = hashchain::decode_input(s.data(), s.size());
  return py::make_tuple(py::int_(in.n), digest_to_bytes(in.seed));
}

static py::bytes encode_input_py(std::uint64_t n, const py::bytes& seed) {
  hashchain::ChainInput in;
  in.n = n;
  in.seed = digest_from_bytes(seed);
  auto buf = hashchain::encode_input(in);
  return py::bytes(reinterpret_cast<const char*>(buf.data()), buf.size());
}

PYBIND11_MODULE(hashchain, m) {
  m.doc() = "Iterated SHA-256 chain core (pybind11)";
  m.attr("__version__") = hashchain::HASHCHAIN_VERSION;

  // MalformedInput derives from std::invalid_argument, which pybind11 maps to ValueError.

  m.def("hash_chain", &hash_chain_py,
      py::arg("n"),
      py::arg("seed"),
      py::arg("progress_stride") = 0,         // 0 => auto (~1% of n)
      py::arg("callback") = py::none(),
      R"pbdoc(
Apply SHA-256 to `seed` n times.

Args:
  n (int): iteration count, 0 <= n < 2**64.
  seed (bytes): exactly 32 bytes of initial state.
  progress_stride (int): 0 for auto (~1% of n); otherwise invoke the callback every N iterations.
  callback (callable): optional function (iter:int, state:bytes) -> None.

Returns:
  dict { n, digest, words, ns_elapsed, engine_info }.
)pbdoc");

  m.def("decode_input", &decode_input_py, py::arg("data"),
        R"pbdoc(Split a 40-byte input blob into (n, seed); raises ValueError if shorter.)pbdoc");

  m.def("encode_input", &encode_input_py, py::arg("n"), py::arg("seed"),
        R"pbdoc(Build the 40-byte input blob: n little-endian, then the seed.)pbdoc");
}
