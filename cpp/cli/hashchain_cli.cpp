#include "hashchain/hashchain.hpp"
#include "hashchain/hash.hpp"
#include "hashchain/input.hpp"
#include "hashchain/io.hpp"
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {
void usage() {
  std::cerr << "usage: hashchain_cli [PATH | --public=P --private=Q | --n=N --secret=S]\n"
               "                     [--stride=K] [--no-progress] [--bench=R] [--digest]\n";
}

// stoull skips whitespace and wraps a leading '-'; only plain digits are accepted.
std::uint64_t parse_u64(const std::string& s) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
    throw std::invalid_argument("'" + s + "' is not an unsigned integer");
  return std::stoull(s);  // out_of_range past 2^64-1
}
} // namespace

int main(int argc, char** argv) {
  // Flags: --bench=N (repeat), --stride=K, --no-progress, --digest
  unsigned repeats = 1;
  std::uint64_t stride = 0;   // 0 = auto (~1%)
  bool enable_progress = true, show_digest = false;
  std::string input_path, public_path, private_path, secret;
  std::uint64_t n = 0;
  bool have_n = false, have_secret = false;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a.rfind("--bench=", 0) == 0) {
        std::uint64_t v = parse_u64(a.substr(8));
        if (v > std::numeric_limits<unsigned>::max())
          throw std::out_of_range("--bench out of range");
        repeats = v ? static_cast<unsigned>(v) : 1u;
      } else if (a.rfind("--stride=", 0) == 0) {
        stride = parse_u64(a.substr(9));
      } else if (a == "--no-progress") {
        enable_progress = false;
      } else if (a == "--digest") {
        show_digest = true;
      } else if (a.rfind("--public=", 0) == 0) {
        public_path = a.substr(9);
      } else if (a.rfind("--private=", 0) == 0) {
        private_path = a.substr(10);
      } else if (a.rfind("--n=", 0) == 0) {
        n = parse_u64(a.substr(4)); have_n = true;
      } else if (a.rfind("--secret=", 0) == 0) {
        secret = a.substr(9); have_secret = true;
      } else if (a == "-h" || a == "--help") {
        usage(); return 0;
      } else if (a.rfind("--", 0) == 0 || !input_path.empty()) {
        std::cerr << "unexpected argument '" << a << "'\n"; usage(); return 2;
      } else {
        input_path = a;
      }
    }
  } catch (const std::logic_error& e) { // invalid_argument, out_of_range
    std::cerr << "bad numeric flag: " << e.what() << "\n"; usage(); return 2;
  }

  if (public_path.empty() != private_path.empty() || have_n != have_secret) {
    std::cerr << "--public/--private and --n/--secret must be given together\n";
    usage(); return 2;
  }
  if (int(have_n) + int(!public_path.empty()) + int(!input_path.empty()) > 1) {
    std::cerr << "choose one input: PATH, --public/--private, or --n/--secret\n";
    usage(); return 2;
  }

  std::unique_ptr<hashchain::ByteSource> src;
  if (have_n) {
    hashchain::ChainInput in;
    in.n = n;
    in.seed = hashchain::seed_from_secret(secret);
    src = std::make_unique<hashchain::MemorySource>(hashchain::encode_input(in));
  } else if (!public_path.empty()) {
    src = std::make_unique<hashchain::SplitFileSource>(public_path, private_path);
  } else {
    src = std::make_unique<hashchain::FileSource>(input_path.empty() ? "input.bin" : input_path);
  }

  try {
    std::uint64_t best = UINT64_MAX, sum = 0;
    for (unsigned r = 0; r < repeats; ++r) {
      int last = -1;
      std::uint64_t total = 0;
      auto progress = [&](std::uint64_t iter, const hashchain::Digest& d) {
        (void)d;
        if (!total) return;
        int pct = int(double(iter) * 100.0 / double(total));
        if (pct / 20 > last) {  // print at ~20% steps
          std::cerr << "  n="<<total<<" "<<pct<<"%\n";
          last = pct / 20;
        }
      };

      // Only the first run goes to stdout; bench repeats are silent.
      hashchain::VectorSink quiet;
      hashchain::TextSink text(std::cout);
      hashchain::OutputSink& sink = (r == 0) ? static_cast<hashchain::OutputSink&>(text) : quiet;

      // n is not known until the source is decoded; peek it for the progress scale.
      std::vector<std::uint8_t> buf = src->read();
      total = hashchain::decode_input(buf).n;
      hashchain::MemorySource mem(std::move(buf));

      auto res = hashchain::evaluate(mem, sink,
                                     (enable_progress && repeats == 1) ? hashchain::ProgressCb(progress)
                                                                       : hashchain::ProgressCb{},
                                     stride);
      sum += res.ns_elapsed; if (res.ns_elapsed < best) best = res.ns_elapsed;
      if (r == 0) {
        if (show_digest)
          std::cout << "digest: " << hashchain::to_hex(res.digest) << "\n";
        std::cerr << "n="<<res.n<<" | core(ns)="<<res.ns_elapsed
                  <<" | engine="<<res.engine_info<<"\n";
      }
    }
    if (repeats > 1) {
      std::cerr << "bench repeats="<<repeats
                <<" | best(ns)="<<best<<" | avg(ns)="<< (sum / repeats) << "\n";
    }
  } catch (const hashchain::MalformedInput& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::runtime_error& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
