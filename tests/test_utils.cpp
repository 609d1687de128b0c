#include "tile_develop/core/errors.hpp"
#include "tile_develop/core/events.hpp"
#include "tile_develop/core/utils.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace tile_develop;

TEST_CASE("sha256_string_matches_known_digest") {
    REQUIRE(core::sha256_string("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(core::sha256_string("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("sha256_bytes_agrees_with_string_form") {
    const std::string text = "tile_develop";
    const std::vector<uint8_t> bytes(text.begin(), text.end());
    REQUIRE(core::sha256_bytes(bytes) == core::sha256_string(text));
}

TEST_CASE("format_bytes_uses_binary_units") {
    REQUIRE(core::format_bytes(512) == "512 B");
    REQUIRE(core::format_bytes(1024) == "1.00 KiB");
    REQUIRE(core::format_bytes(3 * 1024 * 1024) == "3.00 MiB");
}

TEST_CASE("to_lower_handles_mixed_case") {
    REQUIRE(core::to_lower("Canon EOS R5") == "canon eos r5");
}

TEST_CASE("read_text_of_missing_file_throws_io_error") {
    REQUIRE_THROWS_AS(core::read_text("/nonexistent/tile_develop/file.json"), IOError);
}

TEST_CASE("run_guarded_reports_any_exception_as_exit_code_1") {
    std::ostringstream err;
    REQUIRE(core::run_guarded([]() { return 0; }, err) == 0);
    REQUIRE(err.str().empty());

    REQUIRE(core::run_guarded([]() -> int { throw ValidationError("bad group"); }, err) == 1);
    REQUIRE(err.str().find("bad group") != std::string::npos);

    std::ostringstream err2;
    REQUIRE(core::run_guarded(
                []() -> int { return static_cast<int>(std::vector<int>{}.at(3)); }, err2) == 1);
    REQUIRE(err2.str().rfind("Error: ", 0) == 0);

    std::ostringstream err3;
    REQUIRE(core::run_guarded([]() -> int { throw std::runtime_error("disk full"); }, err3) ==
            1);
    REQUIRE(err3.str() == "Error: disk full\n");
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
    std::ostringstream out;
    core::EventEmitter events(&out);
    events.run_start("run1", {{"image_id", "a.png"}});
    events.tile_done("run1", 1, 4, 0, 2);
    events.run_end("run1", true, "ok");

    std::istringstream in(out.str());
    std::string line;
    std::vector<core::json> parsed;
    while (std::getline(in, line)) {
        parsed.push_back(core::json::parse(line));
    }
    REQUIRE(parsed.size() == 3);
    REQUIRE(parsed[0]["type"] == "render_start");
    REQUIRE(parsed[0]["image_id"] == "a.png");
    REQUIRE(parsed[1]["type"] == "tile_done");
    REQUIRE(parsed[2]["success"] == true);
    for (const auto& e : parsed) {
        REQUIRE(e["run_id"] == "run1");
        REQUIRE(e.contains("ts"));
    }
}

TEST_CASE("event_emitter_without_stream_is_silent") {
    core::EventEmitter events(nullptr);
    REQUIRE_FALSE(events.enabled());
    events.warning("run", "ignored");
}
