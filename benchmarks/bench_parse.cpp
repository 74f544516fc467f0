#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tandem_json/tandem_json.hpp>

// Usage: bench_parse [file.json] [iterations]
int main(int argc, char **argv) {
  const char *filename = argc > 1 ? argv[1] : "twitter.json";
  size_t iterations = argc > 2 ? std::stoul(argv[2]) : 200;
  std::string json_content = bench::read_file(filename);

  bench::print_header("Single Document Parse");
  std::cout << "File: " << filename << " (" << (json_content.size() / 1024.0)
            << " KB), " << iterations << " iterations\n\n";
  bench::print_table_header();

  std::vector<bench::Result> results;

  // 1. tandem_json, fresh result per parse
  try {
    bench::Timer timer;
    timer.start();
    for (size_t i = 0; i < iterations; ++i) {
      auto pj = tandem::json::parse_document(json_content);
      (void)pj;
    }
    double ns = timer.elapsed_ns() / iterations;
    results.push_back({"tandem_json", ns, json_content.size(), true});
  } catch (const tandem::json::ParseError &e) {
    std::cout << "tandem_json failed: " << e.format() << "\n";
    results.push_back({"tandem_json", 0.0, json_content.size(), false});
  }

  // 2. tandem_json, recycled result
  try {
    auto pj = tandem::json::parse_document(json_content);
    bench::Timer timer;
    timer.start();
    for (size_t i = 0; i < iterations; ++i)
      pj = tandem::json::parse_document(json_content, std::move(pj));
    double ns = timer.elapsed_ns() / iterations;

    // Semantic equivalence: can we parse our own output?
    auto again = tandem::json::parse_document(pj->to_json());
    bool correct = again->to_json() == pj->to_json();
    results.push_back({"tandem_json (reuse)", ns, json_content.size(),
                       correct});
  } catch (const tandem::json::ParseError &e) {
    std::cout << "tandem_json (reuse) failed: " << e.format() << "\n";
    results.push_back({"tandem_json (reuse)", 0.0, json_content.size(),
                       false});
  }

  // 3. simdjson (parse-only)
  {
    simdjson::dom::parser parser;
    simdjson::padded_string padded(json_content);
    bool correct = true;
    bench::Timer timer;
    timer.start();
    for (size_t i = 0; i < iterations; ++i) {
      simdjson::dom::element doc;
      auto error = parser.parse(padded).get(doc);
      correct = correct && !error;
    }
    double ns = timer.elapsed_ns() / iterations;
    results.push_back({"simdjson (dom)", ns, json_content.size(), correct});
  }

  // 4. nlohmann/json
  {
    bool correct = true;
    bench::Timer timer;
    timer.start();
    for (size_t i = 0; i < iterations; ++i) {
      nlohmann::json j = nlohmann::json::parse(json_content, nullptr, false);
      correct = correct && !j.is_discarded();
    }
    double ns = timer.elapsed_ns() / iterations;
    results.push_back({"nlohmann/json", ns, json_content.size(), correct});
  }

  bench::print_all(results);
  return 0;
}
