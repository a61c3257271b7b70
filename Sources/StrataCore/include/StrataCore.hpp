#pragma once

// StrataCore - record mapping and SQL building over SQLite
//
// Usage:
//   #include <StrataCore.hpp>
//
//   struct Note {
//       std::string id;
//       std::string title;
//       strata::timestamp_t createdAt;
//   };
//   STRATA_RECORD(Note, id, title, createdAt);
//
//   int main() {
//       strata::init();
//       strata::database_manager db(strata::configuration{});  // in-memory
//       db.create_table<Note>();
//
//       db.add(Note{"n1", "Groceries", std::chrono::system_clock::now()});
//
//       for (const auto& note : db.fetch<Note>({strata::query_filter::like("title", "Gro%")})) {
//           std::cout << note.title << std::endl;
//       }
//       strata::shutdown();
//   }

#include "strata/log.hpp"
#include "strata/types.hpp"
#include "strata/errors.hpp"
#include "strata/configuration.hpp"
#include "strata/schema.hpp"
#include "strata/value_converter.hpp"
#include "strata/query.hpp"
#include "strata/engine.hpp"
#include "strata/sqlite_engine.hpp"
#include "strata/direct_decoder.hpp"
#include "strata/record.hpp"
#include "strata/manager.hpp"
