// test_options.cpp - Tests for DiffOptions and options documents

#include <catch2/catch_all.hpp>
#include <configdiff/errors.h>
#include <configdiff/options.h>

#include <string>

using namespace configdiff;

TEST_CASE("DiffOptions validation", "[options]") {
    SECTION("defaults are valid") {
        DiffOptions opts;
        REQUIRE_NOTHROW(opts.validate());
        REQUIRE(opts.ignore_paths.empty());
        REQUIRE_FALSE(opts.stable_order);
    }

    SECTION("empty array path") {
        DiffOptions opts;
        opts.array_set_keys[""] = "name";
        REQUIRE_THROWS_AS(opts.validate(), OptionsError);
    }

    SECTION("empty key field") {
        DiffOptions opts;
        opts.array_set_keys["/items"] = "";
        REQUIRE_THROWS_AS(opts.validate(), OptionsError);
    }
}

TEST_CASE("DiffOptions array_key_for", "[options]") {
    DiffOptions opts;
    opts.array_set_keys["/spec/containers"] = "name";

    REQUIRE(opts.array_key_for("/spec/containers") != nullptr);
    REQUIRE(*opts.array_key_for("/spec/containers") == "name");
    REQUIRE(opts.array_key_for("/spec/containers[0]") == nullptr);
    REQUIRE(opts.array_key_for("/spec") == nullptr);
}

TEST_CASE("parse_array_key", "[options]") {
    SECTION("path=field") {
        auto [path, field] = parse_array_key("/spec/containers=name");
        REQUIRE(path == "/spec/containers");
        REQUIRE(field == "name");
    }

    SECTION("splits at the last '='") {
        auto [path, field] = parse_array_key("/items[kind=a]/list=id");
        REQUIRE(path == "/items[kind=a]/list");
        REQUIRE(field == "id");
    }

    SECTION("malformed specs") {
        REQUIRE_THROWS_AS(parse_array_key("/items"), OptionsError);
        REQUIRE_THROWS_AS(parse_array_key("=name"), OptionsError);
        REQUIRE_THROWS_AS(parse_array_key("/items="), OptionsError);
    }
}

TEST_CASE("options_from_json", "[options][json]") {
    SECTION("full document") {
        auto opts = options_from_json(R"({
            "ignore_paths": ["/metadata/*", "/status"],
            "array_keys": {"/spec/containers": "name"},
            "numeric_strings": true,
            "bool_strings": false,
            "stable_order": true
        })");

        REQUIRE(opts.ignore_paths == std::vector<std::string>{"/metadata/*", "/status"});
        REQUIRE(opts.array_set_keys.size() == 1);
        REQUIRE(opts.array_set_keys.at("/spec/containers") == "name");
        REQUIRE(opts.coercions.numeric_strings);
        REQUIRE_FALSE(opts.coercions.bool_strings);
        REQUIRE(opts.stable_order);
    }

    SECTION("empty document gives defaults") {
        REQUIRE(options_from_json("{}") == DiffOptions{});
    }

    SECTION("unknown key") {
        REQUIRE_THROWS_AS(options_from_json(R"({"ignore": []})"), OptionsError);
    }

    SECTION("wrong value kinds") {
        REQUIRE_THROWS_AS(options_from_json(R"({"stable_order": "yes"})"), OptionsError);
        REQUIRE_THROWS_AS(options_from_json(R"({"ignore_paths": "/a"})"), OptionsError);
        REQUIRE_THROWS_AS(options_from_json(R"({"ignore_paths": [1]})"), OptionsError);
        REQUIRE_THROWS_AS(options_from_json(R"({"array_keys": {"/a": 1}})"), OptionsError);
        REQUIRE_THROWS_AS(options_from_json("[]"), OptionsError);
    }

    SECTION("invalid array key entry") {
        REQUIRE_THROWS_AS(options_from_json(R"({"array_keys": {"/a": ""}})"), OptionsError);
    }

    SECTION("malformed JSON") {
        REQUIRE_THROWS_AS(options_from_json("{"), ParseError);
    }
}

TEST_CASE("options_to_node round trip", "[options][json]") {
    DiffOptions opts;
    opts.ignore_paths = {"/a/*", "/b"};
    opts.array_set_keys["/items"] = "id";
    opts.coercions.bool_strings = true;
    opts.stable_order = true;

    Node node = options_to_node(opts);
    REQUIRE(node.at("ignore_paths").size() == 2);
    REQUIRE(node.at("array_keys").at("/items").as_string() == "id");
    REQUIRE(options_from_node(node) == opts);
}
