#include <catch2/catch_test_macros.hpp>

#include "core/config.hpp"
#include "helpers/test_utils.hpp"

#include <raylib.h>

#include <string>
#include <tuple>
#include <vector>

using namespace rscpack::core;
using test_helpers::TempDir;
using test_helpers::write_file;

// =============================================================================
// Value helpers
// =============================================================================

TEST_CASE("trim, to_lower and strip_quotes", "[core][config]") {
    REQUIRE(trim("  a b \t") == "a b");
    REQUIRE(to_lower("MiNiMiZeD") == "minimized");
    REQUIRE(strip_quotes(" \"C:\\Program Files\\app\" ") == "C:\\Program Files\\app");
    REQUIRE(strip_quotes("'x'") == "x");
    REQUIRE(strip_quotes("\"unbalanced") == "\"unbalanced");
}

TEST_CASE("parse_bool accepts common spellings", "[core][config]") {
    REQUIRE(parse_bool("yes", false));
    REQUIRE(parse_bool("ON", false));
    REQUIRE(parse_bool("1", false));
    REQUIRE_FALSE(parse_bool("off", true));
    REQUIRE_FALSE(parse_bool("0", true));

    SECTION("unknown values keep the default") {
        REQUIRE(parse_bool("maybe", true));
        REQUIRE_FALSE(parse_bool("", false));
    }
}

TEST_CASE("parse_int rejects trailing garbage", "[core][config]") {
    REQUIRE(parse_int(" 42 ", 0) == 42);
    REQUIRE(parse_int("42abc", -1) == -1);
    REQUIRE(parse_int("", 5) == 5);
}

TEST_CASE("log levels map to raylib levels", "[core][config]") {
    REQUIRE(log_level_from_string("debug", LOG_INFO) == LOG_DEBUG);
    REQUIRE(log_level_from_string("WARN", LOG_INFO) == LOG_WARNING);
    REQUIRE(log_level_from_string("off", LOG_INFO) == LOG_NONE);
    REQUIRE(log_level_from_string("bogus", LOG_INFO) == LOG_INFO);

    SECTION("names round-trip") {
        for (int level : {LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_NONE}) {
            REQUIRE(log_level_from_string(log_level_name(level), -1) == level);
        }
    }
}

TEST_CASE("default logging config is INFO without a file sink", "[core][config]") {
    const LoggingConfig cfg = default_logging_config();
    REQUIRE(cfg.enabled);
    REQUIRE(cfg.level == LOG_INFO);
    REQUIRE(cfg.file.empty());
}

// =============================================================================
// INI parsing
// =============================================================================

TEST_CASE("parse_ini_file reports sections, keys and values", "[core][config]") {
    TempDir dir;
    const auto path = dir / "test.ini";
    write_file(path, std::string(
        "# comment\n"
        "; another comment\n"
        "top = level\n"
        "\n"
        "[Project]\n"
        "Main_File = app.exe\n"
        "extraction_path = \"%TEMP%\\my app\"\n"
        "note = a;b#c\n"
        "not a key value line\n"
        "[resources]\n"
        "resource = one.bin\n"
        "resource = two.bin\n"));

    std::vector<std::tuple<std::string, std::string, std::string>> seen;
    std::string err;
    REQUIRE(parse_ini_file(path, [&](const std::string& s, const std::string& k, const std::string& v) {
        seen.emplace_back(s, k, v);
    }, &err));

    REQUIRE(seen.size() == 6);
    REQUIRE(seen[0] == std::make_tuple(std::string(""), std::string("top"), std::string("level")));
    REQUIRE(seen[1] == std::make_tuple(std::string("project"), std::string("main_file"), std::string("app.exe")));
    REQUIRE(std::get<2>(seen[2]) == "%TEMP%\\my app");
    REQUIRE(std::get<2>(seen[3]) == "a;b#c");
    REQUIRE(std::get<2>(seen[4]) == "one.bin");
    REQUIRE(std::get<2>(seen[5]) == "two.bin");
}

TEST_CASE("parse_ini_file fails for a missing file", "[core][config]") {
    TempDir dir;
    std::string err;
    REQUIRE_FALSE(parse_ini_file(dir / "missing.ini", [](const std::string&, const std::string&, const std::string&) {}, &err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("apply_logging_kv updates known keys only", "[core][config]") {
    LoggingConfig cfg = default_logging_config();
    apply_logging_kv(cfg, "enabled", "false");
    apply_logging_kv(cfg, "level", "error");
    apply_logging_kv(cfg, "file", "\"pack.log\"");
    apply_logging_kv(cfg, "colour", "red");

    REQUIRE_FALSE(cfg.enabled);
    REQUIRE(cfg.level == LOG_ERROR);
    REQUIRE(cfg.file == "pack.log");
}
