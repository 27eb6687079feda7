#include "server/question_bank.hpp"

#include <algorithm>
#include <fstream>

#include <sqlite3.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace livequiz::server {

namespace {

bool validate(const std::string& text,
              const std::array<std::string, 4>& options,
              int correct_index,
              int time_limit,
              int points,
              std::string* error) {
  auto blank = [](const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
  };
  if (blank(text)) {
    if (error) *error = "question text is empty";
    return false;
  }
  for (const auto& o : options) {
    if (blank(o)) {
      if (error) *error = "every option needs text";
      return false;
    }
  }
  if (correct_index < 0 || correct_index > 3) {
    if (error) *error = "correct option must be 0-3";
    return false;
  }
  if (time_limit <= 0) {
    if (error) *error = "time limit must be positive";
    return false;
  }
  if (points <= 0) {
    if (error) *error = "points must be positive";
    return false;
  }
  return true;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
  const unsigned char* ptr = sqlite3_column_text(stmt, col);
  return ptr ? reinterpret_cast<const char*>(ptr) : "";
}

}  // namespace

QuestionView view_of(const Question& question) {
  QuestionView v;
  v.id = question.id;
  v.text = question.text;
  v.time_limit = question.time_limit;
  v.points = question.points;
  v.options = question.options;
  return v;
}

QuestionBank::QuestionBank() : rng_(std::random_device{}()) {}

std::optional<Question> QuestionBank::add(const std::string& text,
                                          const std::array<std::string, 4>& options,
                                          int correct_index,
                                          int time_limit,
                                          int points,
                                          std::string* error) {
  if (!validate(text, options, correct_index, time_limit, points, error)) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  Question q{next_id_++, text, options, correct_index, time_limit, points};
  questions_.push_back(q);
  return q;
}

int QuestionBank::load_defaults() {
  struct Seed {
    const char* text;
    std::array<std::string, 4> options;
    int correct;
  };
  const std::vector<Seed> seeds = {
      {"What is the default port for HTTP?", {"80", "443", "8080", "3000"}, 0},
      {"Which socket type gives a reliable byte stream?",
       {"SOCK_DGRAM", "SOCK_STREAM", "SOCK_RAW", "SOCK_SEQPACKET"}, 1},
      {"Which call makes a listening socket wait for clients?",
       {"connect()", "accept()", "bind()", "send()"}, 1},
      {"Which protocol is connection-oriented?", {"UDP", "TCP", "ICMP", "DNS"}, 1},
      {"What is the maximum value of a port number?", {"1024", "32767", "65535", "99999"}, 2},
      {"Which OSI layer does socket programming operate at?",
       {"Physical", "Data Link", "Network", "Transport"}, 3},
      {"What is the loopback IP address?",
       {"192.168.0.1", "127.0.0.1", "0.0.0.0", "255.255.255.255"}, 1},
      {"Which system call multiplexes many descriptors on Linux?",
       {"epoll_wait()", "fork()", "mmap()", "pipe()"}, 0},
  };
  int added = 0;
  for (const auto& s : seeds) {
    if (add(s.text, s.options, s.correct, 30, 10)) ++added;
  }
  return added;
}

int QuestionBank::load_json(const std::string& path, std::string* error) {
  std::ifstream in(path);
  if (!in) {
    if (error) *error = "cannot open " + path;
    return -1;
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const std::exception& ex) {
    if (error) *error = std::string("JSON parse error: ") + ex.what();
    return -1;
  }
  if (doc.is_object() && doc.contains("questions")) doc = doc["questions"];
  if (!doc.is_array()) {
    if (error) *error = "expected a JSON array of questions";
    return -1;
  }

  int added = 0;
  for (const auto& item : doc) {
    if (!item.is_object() || !item.contains("options") || !item["options"].is_array() ||
        item["options"].size() != 4) {
      spdlog::warn("questions {}: skipping entry without 4 options", path);
      continue;
    }
    std::array<std::string, 4> options;
    bool options_ok = true;
    for (std::size_t i = 0; i < options.size(); ++i) {
      if (!item["options"][i].is_string()) {
        options_ok = false;
        break;
      }
      options[i] = item["options"][i].get<std::string>();
    }
    if (!options_ok) {
      spdlog::warn("questions {}: skipping entry with non-string option", path);
      continue;
    }
    std::string why;
    std::optional<Question> q;
    try {
      q = add(item.value("text", ""), options, item.value("correct", -1),
              item.value("time_limit", 30), item.value("points", 10), &why);
    } catch (const nlohmann::json::type_error& ex) {
      why = ex.what();
    }
    if (!q) {
      spdlog::warn("questions {}: skipping invalid entry: {}", path, why);
      continue;
    }
    ++added;
  }
  return added;
}

int QuestionBank::load_sqlite(const std::string& path, std::string* error) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
    if (error) *error = db ? sqlite3_errmsg(db) : "DB open failed";
    sqlite3_close(db);
    return -1;
  }

  const char* sql =
      "SELECT text, opt0, opt1, opt2, opt3, correct_option, time_limit, points "
      "FROM questions ORDER BY id;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db);
    sqlite3_close(db);
    return -1;
  }

  int added = 0;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    std::array<std::string, 4> options = {column_text(stmt, 1), column_text(stmt, 2),
                                          column_text(stmt, 3), column_text(stmt, 4)};
    std::string why;
    auto q = add(column_text(stmt, 0), options, sqlite3_column_int(stmt, 5),
                 sqlite3_column_int(stmt, 6), sqlite3_column_int(stmt, 7), &why);
    if (!q) {
      spdlog::warn("questions {}: skipping invalid row: {}", path, why);
      continue;
    }
    ++added;
  }
  if (rc != SQLITE_DONE) {
    if (error) *error = sqlite3_errmsg(db);
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return -1;
  }
  sqlite3_finalize(stmt);
  sqlite3_close(db);
  return added;
}

std::vector<Question> QuestionBank::all() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return questions_;
}

std::vector<Question> QuestionBank::pick(std::size_t count) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<Question> shuffled = questions_;
  std::shuffle(shuffled.begin(), shuffled.end(), rng_);
  if (shuffled.size() > count) shuffled.resize(count);
  return shuffled;
}

std::optional<Question> QuestionBank::find(int question_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto& q : questions_) {
    if (q.id == question_id) return q;
  }
  return std::nullopt;
}

std::size_t QuestionBank::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return questions_.size();
}

void QuestionBank::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  questions_.clear();
  next_id_ = 1;
}

}  // namespace livequiz::server
