/**
 * @file tandem_json.hpp
 * @brief tandem-json: two-stage tape JSON parser with an ordered NDJSON
 *        streaming pipeline.
 *
 * Usage:
 *   auto pj = tandem::json::parse_document(R"({"a":[1,2.5,"x"]})");
 *   int64_t one = pj->root()["a"][0].get_int64();
 *   std::string out = pj->to_json();
 */

#ifndef TANDEM_JSON_HPP
#define TANDEM_JSON_HPP

#include "channel.hpp"
#include "common.hpp"
#include "index_stream.hpp"
#include "log.hpp"
#include "number.hpp"
#include "parser.hpp"
#include "stream.hpp"
#include "string.hpp"
#include "tape.hpp"
#include "tape_builder.hpp"

#endif // TANDEM_JSON_HPP
