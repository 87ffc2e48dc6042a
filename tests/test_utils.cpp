#include "diffmap/core/errors.hpp"
#include "diffmap/core/events.hpp"
#include "diffmap/core/types.hpp"
#include "diffmap/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace diffmap;

TEST_CASE("string_helpers") {
  REQUIRE(core::to_lower("MiXeD") == "mixed");
  REQUIRE(core::starts_with("@@fade", "@@"));
  REQUIRE_FALSE(core::starts_with("@", "@@"));
}

TEST_CASE("diff_status_parsing_is_lenient") {
  REQUIRE(string_to_diff_status("  Mismatch ") == DiffStatus::MISMATCH);
  REQUIRE_FALSE(string_to_diff_status("maybe").has_value());
  for (DiffStatus s : all_diff_statuses()) {
    REQUIRE(string_to_diff_status(diff_status_to_string(s)) == s);
  }
}

TEST_CASE("iso_timestamp_and_run_id_shape") {
  const std::string ts = core::get_iso_timestamp();
  REQUIRE(ts.size() == 24);
  REQUIRE(ts.back() == 'Z');
  REQUIRE(ts[10] == 'T');

  const std::string id = core::get_run_id();
  REQUIRE(id.size() == 24);
  REQUIRE(id[8] == '_');
  REQUIRE(id[15] == '_');
  REQUIRE(id.find_first_not_of("0123456789abcdef", 16) == std::string::npos);
}

TEST_CASE("elapsed_ms_is_monotonic") {
  auto start = std::chrono::steady_clock::now();
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  REQUIRE(core::elapsed_ms(start) >= 1.0);
}

TEST_CASE("read_text_reads_file_and_reports_missing") {
  auto path = std::filesystem::temp_directory_path() / "diffmap_read_text.txt";
  {
    std::ofstream out(path);
    out << "hello\nworld";
  }
  REQUIRE(core::read_text(path) == "hello\nworld");
  std::filesystem::remove(path);
  REQUIRE_THROWS_AS(core::read_text(path), IOError);
}

TEST_CASE("event_emitter_writes_json_lines") {
  std::ostringstream sink;
  core::EventEmitter events(sink, "abc");
  events.run_start({{"images", 2}});
  events.phase_end(Phase::GROUP, "ok", {{"regions", 3}});
  events.run_end(true, "different");

  std::istringstream in(sink.str());
  std::string line;
  std::vector<core::json> lines;
  while (std::getline(in, line)) lines.push_back(core::json::parse(line));

  REQUIRE(lines.size() == 3);
  REQUIRE(lines[0]["type"] == "run_start");
  REQUIRE(lines[0]["images"] == 2);
  REQUIRE(lines[1]["phase"] == 3);
  REQUIRE(lines[1]["phase_name"] == "GROUP");
  REQUIRE(lines[1]["regions"] == 3);
  REQUIRE(lines[2]["success"] == true);
  REQUIRE(lines[2]["run_id"] == "abc");
}
