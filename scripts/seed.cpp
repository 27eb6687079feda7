#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <sqlite3.h>

#include "server/question_bank.hpp"

namespace fs = std::filesystem;

using livequiz::server::Question;
using livequiz::server::QuestionBank;

namespace {

// Finalizes the prepared statement when the scope ends.
struct Statement {
  sqlite3_stmt* handle{nullptr};
  ~Statement() { sqlite3_finalize(handle); }
};

void require_ok(int rc, sqlite3* db, const std::string& what) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return;
  throw std::runtime_error(what + " failed: " + sqlite3_errmsg(db));
}

void apply_schema(sqlite3* db, const fs::path& schema) {
  std::ifstream in(schema, std::ios::binary);
  if (!in) throw std::runtime_error("schema not found: " + schema.string());
  std::ostringstream sql;
  sql << in.rdbuf();
  char* errmsg = nullptr;
  if (sqlite3_exec(db, sql.str().c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
    std::string why = errmsg ? errmsg : "unknown error";
    sqlite3_free(errmsg);
    throw std::runtime_error("applying " + schema.string() + ": " + why);
  }
}

int insert_questions(sqlite3* db, const std::vector<Question>& questions) {
  Statement insert;
  require_ok(sqlite3_prepare_v2(db,
                                "INSERT INTO questions(text, opt0, opt1, opt2, opt3, "
                                "correct_option, time_limit, points) VALUES(?,?,?,?,?,?,?,?);",
                                -1, &insert.handle, nullptr),
             db, "preparing question insert");
  int inserted = 0;
  for (const auto& question : questions) {
    sqlite3_reset(insert.handle);
    sqlite3_bind_text(insert.handle, 1, question.text.c_str(), -1, SQLITE_TRANSIENT);
    for (int i = 0; i < 4; ++i) {
      sqlite3_bind_text(insert.handle, 2 + i, question.options[i].c_str(), -1,
                        SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(insert.handle, 6, question.correct_index);
    sqlite3_bind_int(insert.handle, 7, question.time_limit);
    sqlite3_bind_int(insert.handle, 8, question.points);
    if (sqlite3_step(insert.handle) != SQLITE_DONE) {
      std::cerr << "question \"" << question.text << "\" not stored: " << sqlite3_errmsg(db)
                << "\n";
      continue;
    }
    ++inserted;
  }
  return inserted;
}

// Number of stored questions, or nullopt when the table is missing.
std::optional<int> stored_questions(sqlite3* db) {
  Statement count;
  if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM questions;", -1, &count.handle, nullptr) !=
      SQLITE_OK) {
    return std::nullopt;
  }
  if (sqlite3_step(count.handle) != SQLITE_ROW) return std::nullopt;
  return sqlite3_column_int(count.handle, 0);
}

void print_first_question(sqlite3* db) {
  Statement first;
  if (sqlite3_prepare_v2(db,
                         "SELECT id, text, time_limit, points FROM questions ORDER BY id LIMIT 1;",
                         -1, &first.handle, nullptr) != SQLITE_OK) {
    return;
  }
  if (sqlite3_step(first.handle) != SQLITE_ROW) return;
  const unsigned char* text = sqlite3_column_text(first.handle, 1);
  std::cout << "first question: #" << sqlite3_column_int(first.handle, 0) << " "
            << (text ? reinterpret_cast<const char*>(text) : "") << " ("
            << sqlite3_column_int(first.handle, 2) << "s, "
            << sqlite3_column_int(first.handle, 3) << " pts)\n";
}

void usage(const char* program) {
  std::cerr << "usage: " << program
            << " [db_path] [schema_path] [--reset] [--json questions.json]\n";
}

}  // namespace

int main(int argc, char** argv) {
  bool reset = false;
  fs::path db_path = "data/questions.db";
  fs::path schema_path = "data/schema.sql";
  std::string json_path;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--reset") {
      reset = true;
    } else if (arg == "--json" && i + 1 < argc) {
      json_path = argv[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      usage(argv[0]);
      return 2;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() > 2) {
    usage(argv[0]);
    return 2;
  }
  if (!positional.empty()) db_path = positional[0];
  if (positional.size() > 1) schema_path = positional[1];

  QuestionBank bank;
  std::string error;
  const int loaded = json_path.empty() ? bank.load_defaults() : bank.load_json(json_path, &error);
  if (loaded < 0) {
    std::cerr << "seed: cannot read " << json_path << ": " << error << "\n";
    return 1;
  }

  std::error_code ec;
  if (reset) fs::remove(db_path, ec);
  if (!ec && db_path.has_parent_path()) fs::create_directories(db_path.parent_path(), ec);
  if (ec) {
    std::cerr << "seed: " << db_path.string() << ": " << ec.message() << "\n";
    return 1;
  }

  sqlite3* db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    std::cerr << "seed: cannot open " << db_path.string() << ": "
              << (db ? sqlite3_errmsg(db) : "out of memory") << "\n";
    sqlite3_close(db);
    return 1;
  }

  int status = 0;
  try {
    apply_schema(db, schema_path);
    require_ok(sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr), db, "BEGIN");
    const auto existing = stored_questions(db);
    if (!existing) {
      throw std::runtime_error("questions table missing after applying the schema");
    }
    if (*existing == 0) {
      std::cout << "stored " << insert_questions(db, bank.all()) << " of " << bank.size()
                << " questions\n";
    } else {
      std::cout << db_path.string() << " already holds " << *existing
                << " questions; rerun with --reset to rebuild\n";
    }
    require_ok(sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr), db, "COMMIT");
    print_first_question(db);
  } catch (const std::exception& ex) {
    std::cerr << "seed: " << ex.what() << "\n";
    status = 1;
  }
  sqlite3_close(db);
  return status;
}
