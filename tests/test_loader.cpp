/**
 * @file test_loader.cpp
 * @brief Tests for document loading and rendering
 *
 * Tests cover:
 * - nlohmann::json <-> tree conversion
 * - JSON and TOML file loading, format detection by extension
 * - JSON and TOML rendering, including cycle rejection
 */

#include <catch2/catch_all.hpp>
#include "sharetree/Loader.hpp"
#include "sharetree/DotPath.hpp"
#include "sharetree/Errors.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

using namespace sharetree;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("sharetree_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

// ============================================================================
// nlohmann::json conversion
// ============================================================================

TEST_CASE("from_json builds object and array nodes", "[loader][json]") {
    nlohmann::json doc = {
        {"name", "svc"},
        {"ports", {80, 443}},
        {"tls", {{"enabled", true}, {"ratio", 0.5}}},
        {"none", nullptr}
    };

    Value tree = from_json(doc);

    REQUIRE(tree.node()->kind() == Kind::object());
    CHECK(get_by_dot(tree, "name").as_string() == "svc");
    CHECK(get_by_dot(tree, "ports").node()->kind() == Kind::array());
    CHECK(get_by_dot(tree, "ports.1").as_integer() == 443);
    CHECK(get_by_dot(tree, "tls.enabled").as_boolean());
    CHECK(get_by_dot(tree, "tls.ratio").as_float() == 0.5);
    CHECK(get_by_dot(tree, "none").is_null());
}

TEST_CASE("from_json enumerates keys in nlohmann::json order", "[loader][json]") {
    // nlohmann::json keeps object keys sorted
    auto doc = nlohmann::json::parse(R"({"zeta": 1, "alpha": 2, "mid": 3})");
    Value tree = from_json(doc);
    CHECK(tree.node()->keys() == (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

TEST_CASE("from_json maps unsigned integers", "[loader][json]") {
    nlohmann::json small = std::uint64_t{5};
    nlohmann::json huge = std::numeric_limits<std::uint64_t>::max();

    CHECK(from_json(small).is_integer());
    CHECK(from_json(small).as_integer() == 5);
    CHECK(from_json(huge).is_float());
}

TEST_CASE("to_json renders every kind", "[loader][json]") {
    Value tree = Node::make_object({
        {"list", Node::make_array({1, "two", nullptr})},
        {"point", Node::make_record("Point", {{"x", 1}, {"y", 2}})},
        {"flag", false}
    });

    nlohmann::json out = to_json(tree);

    CHECK(out["list"] == nlohmann::json::array({1, "two", nullptr}));
    CHECK(out["point"]["y"] == 2);
    CHECK(out["flag"] == false);
}

TEST_CASE("to_json of Absent is null", "[loader][json]") {
    CHECK(to_json(Value()).is_null());
}

TEST_CASE("to_json rejects cycles", "[loader][json]") {
    NodePtr node = Node::make_object({{"a", 1}});
    node->set("self", node);

    CHECK_THROWS_AS(to_json(node), CycleError);

    try {
        to_json(node);
    } catch (const CycleError& e) {
        CHECK(e.path() == "self");
    }

    node->clear();
}

TEST_CASE("to_json accepts shared acyclic nodes", "[loader][json]") {
    Value shared = Node::make_object({{"v", 1}});
    Value tree = Node::make_object({{"left", shared}, {"right", shared}});

    nlohmann::json out = to_json(tree);
    CHECK(out["left"] == out["right"]);
}

// ============================================================================
// JSON file loading
// ============================================================================

TEST_CASE("load_json_file reads a document", "[loader][file]") {
    TempFile file(R"({"db": {"host": "localhost", "port": 5432}})");

    Value tree = load_json_file(file.path());

    CHECK(get_by_dot(tree, "db.host").as_string() == "localhost");
    CHECK(get_by_dot(tree, "db.port").as_integer() == 5432);
}

TEST_CASE("load_json_file reports missing files", "[loader][file]") {
    CHECK_THROWS_AS(load_json_file("/nonexistent/sharetree.json"), FileNotFoundError);
}

TEST_CASE("load_json_file reports syntax errors", "[loader][file]") {
    TempFile file(R"({"db": )");
    CHECK_THROWS_AS(load_json_file(file.path()), ParseError);
}

// ============================================================================
// TOML file loading
// ============================================================================

TEST_CASE("load_toml_file maps tables and arrays", "[loader][toml]") {
    TempFile file(
        "title = \"demo\"\n"
        "ports = [80, 443]\n"
        "\n"
        "[database]\n"
        "host = \"localhost\"\n"
        "port = 5432\n"
        "ratio = 0.25\n"
        "enabled = true\n",
        ".toml");

    Value tree = load_toml_file(file.path());

    CHECK(get_by_dot(tree, "title").as_string() == "demo");
    CHECK(get_by_dot(tree, "ports").node()->kind() == Kind::array());
    CHECK(get_by_dot(tree, "ports.0").as_integer() == 80);
    CHECK(get_by_dot(tree, "database").node()->kind() == Kind::object());
    CHECK(get_by_dot(tree, "database.port").as_integer() == 5432);
    CHECK(get_by_dot(tree, "database.ratio").as_float() == 0.25);
    CHECK(get_by_dot(tree, "database.enabled").as_boolean());
}

TEST_CASE("load_toml_file keeps dates as text", "[loader][toml]") {
    TempFile file("released = 2024-05-01\n", ".toml");
    Value tree = load_toml_file(file.path());
    CHECK(get_by_dot(tree, "released").as_string() == "2024-05-01");
}

TEST_CASE("load_toml_file reports syntax errors with position", "[loader][toml]") {
    TempFile file("[broken\nkey = 1\n", ".toml");

    try {
        load_toml_file(file.path());
        FAIL("expected ParseError");
    } catch (const ParseError& e) {
        CHECK(e.file() == file.path());
        CHECK(e.line() >= 1);
    }
}

// ============================================================================
// Format detection
// ============================================================================

TEST_CASE("load_tree_file dispatches on extension", "[loader][file]") {
    TempFile json_file(R"({"kind": "json"})", ".JSON");
    TempFile toml_file("kind = \"toml\"\n", ".toml");

    CHECK(get_by_dot(load_tree_file(json_file.path()), "kind").as_string() == "json");
    CHECK(get_by_dot(load_tree_file(toml_file.path()), "kind").as_string() == "toml");
}

TEST_CASE("load_tree_file rejects unknown extensions", "[loader][file]") {
    TempFile file("key: value\n", ".yaml");
    CHECK_THROWS_AS(load_tree_file(file.path()), UnsupportedFormatError);
}

TEST_CASE("load_tree_file reports missing files", "[loader][file]") {
    CHECK_THROWS_AS(load_tree_file("/nonexistent/sharetree.toml"), FileNotFoundError);
}

TEST_CASE("get_file_extension lowercases", "[loader]") {
    CHECK(get_file_extension("/a/b/Config.TOML") == ".toml");
    CHECK(get_file_extension("noext").empty());
}

// ============================================================================
// Rendering
// ============================================================================

TEST_CASE("to_json_string honours indent", "[loader][render]") {
    Value tree = Node::make_object({{"a", 1}});
    CHECK(to_json_string(tree, -1) == R"({"a":1})");
    CHECK(to_json_string(tree, 2) == "{\n  \"a\": 1\n}");
}

TEST_CASE("to_toml_string round-trips through the TOML loader", "[loader][render]") {
    Value tree = Node::make_object({
        {"name", "svc"},
        {"server", Node::make_object({{"port", 8080}, {"hosts", Node::make_array({"a", "b"})}})}
    });

    TempFile file(to_toml_string(tree), ".toml");
    Value loaded = load_toml_file(file.path());

    CHECK(deep_equal(loaded, tree));
}

TEST_CASE("to_toml_string writes null as empty string", "[loader][render]") {
    Value tree = Node::make_object({{"nothing", nullptr}});

    TempFile file(to_toml_string(tree), ".toml");
    Value loaded = load_toml_file(file.path());

    CHECK(get_by_dot(loaded, "nothing").as_string().empty());
}

TEST_CASE("to_toml_string needs a table root", "[loader][render]") {
    CHECK_THROWS_AS(to_toml_string(Node::make_array({1})), TypeError);
    CHECK_THROWS_AS(to_toml_string(Value(1)), TypeError);
}
