#pragma once
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bench {

// Read entire file into string
inline std::string read_file(const char *path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f.is_open()) {
    throw std::runtime_error(std::string("Failed to open file: ") + path);
  }
  std::streamsize size = f.tellg();
  f.seekg(0, std::ios::beg);
  std::string buffer(static_cast<size_t>(size), '\0');
  if (!f.read(&buffer[0], size)) {
    throw std::runtime_error(std::string("Failed to read file: ") + path);
  }
  return buffer;
}

// Synthetic NDJSON: `records` small objects, one per line
inline std::string make_ndjson(size_t records) {
  std::string out;
  out.reserve(records * 96);
  for (size_t i = 0; i < records; ++i) {
    out += R"({"id":)" + std::to_string(i) + R"(,"user":"user_)" +
           std::to_string(i % 977) + R"(","score":)" +
           std::to_string(i % 1000) + R"(.5,"tags":["a","b\tc"],"ok":)" +
           (i % 2 ? "true" : "false") + "}\n";
  }
  return out;
}

class Timer {
public:
  using clock = std::chrono::steady_clock;

  void start() { start_ = clock::now(); }

  double elapsed_ns() const {
    return std::chrono::duration<double, std::nano>(clock::now() - start_)
        .count();
  }

  double elapsed_ms() const { return elapsed_ns() / 1000000.0; }

private:
  clock::time_point start_;
};

struct Result {
  std::string library;
  double time_ns;
  size_t bytes;
  bool correctness_check;

  void print() const {
    double mbps = time_ns > 0 ? (bytes / (time_ns / 1e9)) / (1 << 20) : 0.0;
    std::cout << std::left << std::setw(28) << library << " | "
              << std::right << std::setw(10) << std::fixed
              << std::setprecision(2) << (time_ns / 1e6) << " ms"
              << " | " << std::setw(9) << mbps << " MiB/s"
              << " | " << (correctness_check ? "PASS" : "FAIL") << "\n";
  }
};

inline void print_header(const std::string &benchmark_name) {
  std::cout << "\n=== " << benchmark_name << " ===\n";
  std::cout << std::string(72, '-') << "\n";
}

inline void print_table_header() {
  std::cout << std::left << std::setw(28) << "Library" << " | Timings\n";
  std::cout << std::string(72, '-') << "\n";
}

inline void print_all(const std::vector<Result> &results) {
  for (const Result &r : results)
    r.print();
}

} // namespace bench
