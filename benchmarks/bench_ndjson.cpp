#include "utils.hpp"
#include <simdjson.h>
#include <tandem_json/tandem_json.hpp>

#include <memory>

// Usage: bench_ndjson [records] [block_mib]
int main(int argc, char **argv) {
  size_t records = argc > 1 ? std::stoul(argv[1]) : 2000000;
  size_t block_mib = argc > 2 ? std::stoul(argv[2]) : 10;
  std::string nd = bench::make_ndjson(records);

  bench::print_header("NDJSON Streaming");
  std::cout << records << " records, " << (nd.size() >> 20) << " MiB, "
            << block_mib << " MiB blocks\n\n";
  bench::print_table_header();

  std::vector<bench::Result> results;

  // 1. tandem_json streaming pipeline, results handed back for reuse
  {
    auto out = std::make_shared<tandem::json::StreamChannel>(8);
    auto reuse = std::make_shared<tandem::json::ReuseChannel>(8);
    tandem::json::StreamOptions opts;
    opts.block_size = block_mib << 20;

    bench::Timer timer;
    timer.start();
    tandem::json::parse_ndjson_stream(
        std::make_unique<tandem::json::MemoryReader>(nd), out, reuse, opts);
    size_t seen = 0;
    bool correct = false;
    while (std::optional<tandem::json::Stream> s = out->pop()) {
      if (s->error) {
        correct = s->eof();
        if (!correct)
          std::cout << "tandem_json failed: " << s->error->format() << "\n";
        continue;
      }
      seen += s->value->record_count();
      std::unique_ptr<tandem::json::ParsedJson> done = std::move(s->value);
      reuse->try_push(done);
    }
    double ns = timer.elapsed_ns();
    results.push_back(
        {"tandem_json (stream)", ns, nd.size(), correct && seen == records});
  }

  // 2. tandem_json, whole input as one NDJSON document
  try {
    bench::Timer timer;
    timer.start();
    auto pj = tandem::json::parse_ndjson_document(nd);
    double ns = timer.elapsed_ns();
    results.push_back({"tandem_json (document)", ns, nd.size(),
                       pj->record_count() == records});
  } catch (const tandem::json::ParseError &e) {
    std::cout << "tandem_json (document) failed: " << e.format() << "\n";
  }

  // 3. simdjson parse_many
  {
    simdjson::dom::parser parser;
    simdjson::padded_string padded(nd);
    bench::Timer timer;
    timer.start();
    size_t seen = 0;
    bool correct = true;
    simdjson::dom::document_stream stream;
    if (parser.parse_many(padded).get(stream)) {
      correct = false;
    } else {
      for (auto doc : stream) {
        if (doc.error()) {
          correct = false;
          break;
        }
        ++seen;
      }
    }
    double ns = timer.elapsed_ns();
    results.push_back(
        {"simdjson (parse_many)", ns, nd.size(), correct && seen == records});
  }

  bench::print_all(results);
  return 0;
}
