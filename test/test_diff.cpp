// test_diff.cpp - Tests for the structural differ

#include <catch2/catch_all.hpp>
#include <configdiff/diff.h>
#include <configdiff/errors.h>
#include <configdiff/serialization.h>

#include <algorithm>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

using namespace configdiff;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Node deployment_v1() {
    return from_json(R"({
        "metadata": {"name": "web", "generation": 4},
        "spec": {
            "replicas": 2,
            "containers": [
                {"name": "app", "image": "app:1.0"},
                {"name": "sidecar", "image": "proxy:2"}
            ],
            "args": ["--port", "80"]
        },
        "status": {"ready": 2}
    })");
}

Node deployment_v2() {
    return from_json(R"({
        "metadata": {"name": "web", "generation": 5},
        "spec": {
            "replicas": 3,
            "containers": [
                {"name": "sidecar", "image": "proxy:2"},
                {"name": "app", "image": "app:1.1"},
                {"name": "metrics", "image": "exporter:1"}
            ],
            "args": ["--port", "8080", "--verbose"]
        },
        "status": {"ready": 3}
    })");
}

DiffOptions stable() {
    DiffOptions opts;
    opts.stable_order = true;
    return opts;
}

std::vector<std::string> paths_of(const std::vector<Change>& changes) {
    std::vector<std::string> paths;
    for (const auto& c : changes) {
        paths.push_back(c.path);
    }
    return paths;
}

} // namespace

// ============================================================
// Change
// ============================================================

TEST_CASE("Change accessors", "[diff][change]") {
    Change add{ChangeType::Add, "/a", std::nullopt, NodeBox{Node{1}}};
    REQUIRE(add.has_new());
    REQUIRE_FALSE(add.has_old());
    REQUIRE(add.value().as_number() == 1.0);
    REQUIRE_THROWS_AS(add.get_old(), std::runtime_error);

    Change remove{ChangeType::Remove, "/a", NodeBox{Node{"x"}}, std::nullopt};
    REQUIRE(remove.value().as_string() == "x");
    REQUIRE_THROWS_AS(remove.get_new(), std::runtime_error);

    REQUIRE(change_type_name(ChangeType::Add) == "add");
    REQUIRE(change_type_name(ChangeType::Remove) == "remove");
    REQUIRE(change_type_name(ChangeType::Modify) == "modify");
    REQUIRE(change_type_name(ChangeType::Move) == "move");
}

// ============================================================
// Basic traversal
// ============================================================

TEST_CASE("diff of identical trees is empty", "[diff][identity]") {
    auto tree = deployment_v1();

    SECTION("same instance") {
        REQUIRE(diff(tree, tree).empty());
    }

    SECTION("equal copies") {
        REQUIRE(diff(deployment_v1(), deployment_v1()).empty());
    }

    SECTION("under every option combination") {
        DiffOptions opts;
        opts.ignore_paths = {"/status/*"};
        opts.array_set_keys["/spec/containers"] = "name";
        opts.coercions = {.numeric_strings = true, .bool_strings = true};
        opts.stable_order = true;
        REQUIRE(diff(tree, tree, opts).empty());
    }

    SECTION("NaN values") {
        auto with_nan = Node::object({{"x", std::numeric_limits<double>::quiet_NaN()}});
        REQUIRE(diff(with_nan, Node::object({{"x", std::numeric_limits<double>::quiet_NaN()}})).empty());
    }
}

TEST_CASE("diff scalars", "[diff][scalar]") {
    SECTION("modified number") {
        auto changes = diff(Node::object({{"keep", 1}}), Node::object({{"keep", 2}}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type == ChangeType::Modify);
        REQUIRE(changes[0].path == "/keep");
        REQUIRE(changes[0].get_old().as_number() == 1.0);
        REQUIRE(changes[0].get_new().as_number() == 2.0);
    }

    SECTION("root scalar") {
        auto changes = diff(Node{"a"}, Node{"b"});
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].path == "/");
    }

    SECTION("null vs null") {
        REQUIRE(diff(Node{}, Node{}).empty());
    }

    SECTION("kind mismatch without coercion") {
        auto changes = diff(Node::object({{"v", Node{}}}), Node::object({{"v", false}}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type == ChangeType::Modify);
        REQUIRE(changes[0].get_old().is_null());
        REQUIRE(changes[0].get_new().is_bool());
    }

    SECTION("kind mismatch between containers does not recurse") {
        auto changes = diff(Node::object({{"v", Node::array({1, 2})}}),
                            Node::object({{"v", Node::object({{"a", 1}})}}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].path == "/v");
        REQUIRE(changes[0].get_old().is_array());
        REQUIRE(changes[0].get_new().is_object());
    }
}

TEST_CASE("diff objects", "[diff][object]") {
    SECTION("added and removed members carry full subtrees") {
        auto changes = diff(Node::object({{"gone", Node::object({{"x", 1}})}}),
                            Node::object({{"new", Node::array({1, 2})}}),
                            stable());
        REQUIRE(changes.size() == 2);
        REQUIRE(changes[0].type == ChangeType::Add);
        REQUIRE(changes[0].path == "/new");
        REQUIRE(changes[0].get_new().size() == 2);
        REQUIRE(changes[1].type == ChangeType::Remove);
        REQUIRE(changes[1].path == "/gone");
        REQUIRE(changes[1].get_old().at("x").as_number() == 1.0);
    }

    SECTION("nested paths") {
        auto changes = diff(Node::object({{"a", Node::object({{"b", Node::object({{"c", 1}})}})}}),
                            Node::object({{"a", Node::object({{"b", Node::object({{"c", 2}})}})}}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].path == "/a/b/c");
    }

    SECTION("objects themselves never produce a change") {
        auto changes = diff(Node::object({}), Node::object({{"a", 1}}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].path == "/a");
    }
}

TEST_CASE("diff absent roots", "[diff][absent]") {
    Node tree = Node::object({{"a", 1}});

    SECTION("both absent") {
        REQUIRE(diff(nullptr, nullptr).empty());
    }

    SECTION("old absent") {
        auto changes = diff(nullptr, &tree);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type == ChangeType::Add);
        REQUIRE(changes[0].path == "/");
        REQUIRE(changes[0].get_new() == tree);
    }

    SECTION("new absent") {
        auto changes = diff(&tree, nullptr);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type == ChangeType::Remove);
    }

    SECTION("null node is not absent") {
        Node null_node;
        auto changes = diff(&null_node, &tree);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type == ChangeType::Modify);
    }
}

// ============================================================
// Arrays
// ============================================================

TEST_CASE("diff positional arrays", "[diff][array]") {
    SECTION("tail addition at root") {
        auto changes = diff(Node::array({"x"}), Node::array({"x", "y"}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type == ChangeType::Add);
        REQUIRE(changes[0].path == "/[1]");
        REQUIRE(changes[0].get_new().as_string() == "y");
    }

    SECTION("tail removal") {
        auto changes = diff(Node::object({{"l", Node::array({1, 2, 3})}}),
                            Node::object({{"l", Node::array({1})}}));
        REQUIRE(paths_of(changes) == std::vector<std::string>{"/l[1]", "/l[2]"});
        REQUIRE(changes[0].type == ChangeType::Remove);
        REQUIRE(changes[1].type == ChangeType::Remove);
    }

    SECTION("reordering is reported positionally") {
        auto changes = diff(Node::array({"a", "b"}), Node::array({"b", "a"}));
        REQUIRE(paths_of(changes) == std::vector<std::string>{"/[0]", "/[1]"});
        REQUIRE(changes[0].type == ChangeType::Modify);
    }

    SECTION("nested element members") {
        auto changes = diff(Node::array({Node::object({{"id", 1}})}),
                            Node::array({Node::object({{"id", 2}})}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].path == "/[0]/id");
    }
}

TEST_CASE("diff keyed arrays", "[diff][keyed]") {
    DiffOptions opts = stable();
    opts.array_set_keys["/"] = "name";

    SECTION("match by identity field") {
        auto a = from_json(R"([{"name": "p", "v": 1}])");
        auto b = from_json(R"([{"name": "p", "v": 2}, {"name": "q", "v": 3}])");
        auto changes = diff(a, b, opts);

        REQUIRE(changes.size() == 2);
        REQUIRE(changes[0].type == ChangeType::Modify);
        REQUIRE(changes[0].path == "/[name=p]/v");
        REQUIRE(changes[0].get_old().as_number() == 1.0);
        REQUIRE(changes[0].get_new().as_number() == 2.0);
        REQUIRE(changes[1].type == ChangeType::Add);
        REQUIRE(changes[1].path == "/[name=q]");
        REQUIRE(changes[1].get_new().at("v").as_number() == 3.0);
    }

    SECTION("reordering alone is not a change") {
        auto a = from_json(R"([{"name": "p"}, {"name": "q"}])");
        auto b = from_json(R"([{"name": "q"}, {"name": "p"}])");
        REQUIRE(diff(a, b, opts).empty());
    }

    SECTION("removed element") {
        auto a = from_json(R"([{"name": "p"}, {"name": "q"}])");
        auto b = from_json(R"([{"name": "q"}])");
        auto changes = diff(a, b, opts);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type == ChangeType::Remove);
        REQUIRE(changes[0].path == "/[name=p]");
    }

    SECTION("non-qualifying elements are excluded") {
        auto a = from_json(R"([{"name": "p"}, {"name": ""}, {"name": 7}, "loose", {"other": 1}])");
        auto b = from_json(R"([{"name": "p"}])");
        REQUIRE(diff(a, b, opts).empty());
    }

    SECTION("duplicate identities keep the last element") {
        auto a = from_json(R"([{"name": "p", "v": 1}, {"name": "p", "v": 2}])");
        auto b = from_json(R"([{"name": "p", "v": 2}])");
        REQUIRE(diff(a, b, opts).empty());
    }

    SECTION("only the exact path is keyed") {
        DiffOptions nested = stable();
        nested.array_set_keys["/spec/containers"] = "name";
        auto changes = diff(deployment_v1(), deployment_v2(), nested);
        auto paths = paths_of(changes);
        REQUIRE(std::find(paths.begin(), paths.end(), "/spec/containers[name=app]/image") != paths.end());
        REQUIRE(std::find(paths.begin(), paths.end(), "/spec/containers[name=metrics]") != paths.end());
        // args stays positional
        REQUIRE(std::find(paths.begin(), paths.end(), "/spec/args[1]") != paths.end());
        REQUIRE(std::find(paths.begin(), paths.end(), "/spec/args[2]") != paths.end());
    }

    SECTION("keyed order without stable_order follows first appearance") {
        DiffOptions unordered;
        unordered.array_set_keys["/"] = "id";
        auto a = from_json(R"([{"id": "z", "v": 1}, {"id": "a", "v": 1}])");
        auto b = from_json(R"([{"id": "m", "v": 1}, {"id": "a", "v": 2}, {"id": "z", "v": 2}])");
        auto changes = diff(a, b, unordered);
        REQUIRE(paths_of(changes) == std::vector<std::string>{"/[id=z]/v", "/[id=a]/v", "/[id=m]"});
    }
}

// ============================================================
// Ignore patterns
// ============================================================

TEST_CASE("diff ignore patterns", "[diff][ignore]") {
    SECTION("ignored subtree") {
        DiffOptions opts;
        opts.ignore_paths = {"/skip/*"};
        auto changes = diff(from_json(R"({"keep": 1, "skip": {"x": 1}})"),
                            from_json(R"({"keep": 2, "skip": {"x": 2}})"), opts);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type == ChangeType::Modify);
        REQUIRE(changes[0].path == "/keep");
    }

    SECTION("ignored paths suppress additions and removals") {
        DiffOptions opts;
        opts.ignore_paths = {"/metadata"};
        auto changes = diff(from_json(R"({"metadata": {"a": 1}})"), from_json(R"({})"), opts);
        REQUIRE(changes.empty());
    }

    SECTION("trailing wildcards across a document") {
        DiffOptions opts = stable();
        opts.ignore_paths = {"/metadata/*", "/status/*"};
        auto changes = diff(deployment_v1(), deployment_v2(), opts);
        for (const auto& c : changes) {
            REQUIRE(c.path.rfind("/spec", 0) == 0);
        }
        REQUIRE_FALSE(changes.empty());
    }

    SECTION("embedded wildcard suppresses nested fields") {
        DiffOptions opts = stable();
        opts.ignore_paths = {"/spec/*/image"};
        auto paths = paths_of(diff(deployment_v1(), deployment_v2(), opts));

        for (const auto& p : paths) {
            REQUIRE_FALSE(p.ends_with("/image"));
        }
        auto has = [&](const std::string& path) {
            return std::find(paths.begin(), paths.end(), path) != paths.end();
        };
        REQUIRE(has("/spec/replicas"));
        REQUIRE(has("/spec/containers[0]/name"));
        REQUIRE(has("/spec/containers[2]"));
        REQUIRE(has("/metadata/generation"));
    }

    SECTION("embedded wildcard under a keyed array") {
        DiffOptions opts = stable();
        opts.ignore_paths = {"/spec/*/image"};
        opts.array_set_keys["/spec/containers"] = "name";
        auto paths = paths_of(diff(deployment_v1(), deployment_v2(), opts));

        REQUIRE(std::find(paths.begin(), paths.end(), "/spec/containers[name=app]/image") == paths.end());
        REQUIRE(std::find(paths.begin(), paths.end(), "/spec/containers[name=metrics]") != paths.end());
        REQUIRE(std::find(paths.begin(), paths.end(), "/spec/replicas") != paths.end());
    }

    SECTION("ignored subtrees write no diagnostics") {
        DiffOptions opts;
        opts.ignore_paths = {"/metadata/*", "/status/*"};

        std::ostringstream captured;
        auto* previous = std::cerr.rdbuf(captured.rdbuf());
        auto changes = diff(deployment_v1(), deployment_v2(), opts);
        std::cerr.rdbuf(previous);

        REQUIRE_FALSE(changes.empty());
        REQUIRE(captured.str().empty());
    }

    SECTION("root wildcard ignores everything") {
        DiffOptions opts;
        opts.ignore_paths = {"/*"};
        REQUIRE(diff(deployment_v1(), deployment_v2(), opts).empty());
    }
}

// ============================================================
// Coercion
// ============================================================

TEST_CASE("diff with coercions", "[diff][coercion]") {
    SECTION("numeric strings") {
        DiffOptions opts;
        opts.coercions.numeric_strings = true;
        REQUIRE(diff(Node{"42"}, Node{42}, opts).empty());
        REQUIRE(diff(Node{"42"}, Node{42}).size() == 1);
        REQUIRE(diff(Node{"42"}, Node{43}, opts).size() == 1);
    }

    SECTION("bool strings") {
        DiffOptions opts;
        opts.coercions.bool_strings = true;
        REQUIRE(diff(Node::object({{"on", "true"}}), Node::object({{"on", true}}), opts).empty());
        REQUIRE(diff(Node::object({{"on", "yes"}}), Node::object({{"on", true}}), opts).size() == 1);
    }
}

// ============================================================
// Ordering and symmetry
// ============================================================

TEST_CASE("diff stable order", "[diff][order]") {
    auto changes = diff(deployment_v1(), deployment_v2(), stable());
    auto paths = paths_of(changes);
    REQUIRE(std::is_sorted(paths.begin(), paths.end()));
    REQUIRE(paths == std::vector<std::string>{
        "/metadata/generation",
        "/spec/args[1]",
        "/spec/args[2]",
        "/spec/containers[0]/image",
        "/spec/containers[0]/name",
        "/spec/containers[1]/image",
        "/spec/containers[1]/name",
        "/spec/containers[2]",
        "/spec/replicas",
        "/status/ready",
    });
}

TEST_CASE("diff add/remove symmetry", "[diff][symmetry]") {
    auto forward = diff(deployment_v1(), deployment_v2(), stable());
    auto backward = diff(deployment_v2(), deployment_v1(), stable());
    REQUIRE(forward.size() == backward.size());

    for (const auto& c : forward) {
        auto it = std::find_if(backward.begin(), backward.end(),
                               [&](const Change& other) { return other.path == c.path; });
        REQUIRE(it != backward.end());
        if (c.type == ChangeType::Add) {
            REQUIRE(it->type == ChangeType::Remove);
            REQUIRE(it->get_old() == c.get_new());
        } else if (c.type == ChangeType::Modify) {
            REQUIRE(it->type == ChangeType::Modify);
            REQUIRE(it->get_old() == c.get_new());
            REQUIRE(it->get_new() == c.get_old());
        }
    }
}

// ============================================================
// DiffCollector
// ============================================================

TEST_CASE("DiffCollector", "[diff][collector]") {
    SECTION("rejects malformed options before traversal") {
        DiffOptions bad;
        bad.array_set_keys["/items"] = "";
        REQUIRE_THROWS_AS(DiffCollector{bad}, OptionsError);
        REQUIRE_THROWS_AS(diff(Node{}, Node{}, bad), OptionsError);
    }

    SECTION("collect, take and clear") {
        DiffCollector collector{stable()};
        collector.diff(Node::object({{"a", 1}}), Node::object({{"a", 2}}));
        REQUIRE(collector.has_changes());
        REQUIRE(collector.get_changes().size() == 1);

        auto taken = collector.take_changes();
        REQUIRE(taken.size() == 1);
        REQUIRE_FALSE(collector.has_changes());

        collector.diff(Node{1}, Node{2});
        collector.clear();
        REQUIRE_FALSE(collector.has_changes());
    }

    SECTION("each diff replaces the previous result") {
        DiffCollector collector;
        collector.diff(Node{1}, Node{2});
        collector.diff(Node{1}, Node{1});
        REQUIRE_FALSE(collector.has_changes());
    }

    SECTION("print_changes") {
        DiffCollector collector{stable()};
        collector.diff(Node::object({{"a", 1}, {"b", "x"}}), Node::object({{"a", 2}, {"c", true}}));

        std::ostringstream oss;
        collector.print_changes(oss);
        REQUIRE(oss.str() ==
                "MODIFY /a: 1 -> 2\n"
                "REMOVE /b: \"x\"\n"
                "ADD    /c: true\n");

        std::ostringstream empty;
        print_changes({}, empty);
        REQUIRE(empty.str() == "(no changes)\n");
    }
}

TEST_CASE("has_any_difference", "[diff]") {
    REQUIRE_FALSE(has_any_difference(deployment_v1(), deployment_v1()));
    REQUIRE(has_any_difference(deployment_v1(), deployment_v2()));

    DiffOptions opts;
    opts.coercions.numeric_strings = true;
    REQUIRE_FALSE(has_any_difference(Node{"1.0"}, Node{1}, opts));

    SECTION("honors ignore patterns") {
        DiffOptions ignore_all;
        ignore_all.ignore_paths = {"/metadata/*", "/spec/*", "/status/*"};
        REQUIRE_FALSE(has_any_difference(deployment_v1(), deployment_v2(), ignore_all));
    }

    SECTION("stops at the first change") {
        const auto v1 = deployment_v1();
        const auto v2 = deployment_v2();
        DiffCollector collector;
        REQUIRE_FALSE(collector.any_difference(nullptr, nullptr));
        REQUIRE(collector.any_difference(&v1, &v2));
        REQUIRE(collector.get_changes().size() == 1);

        collector.diff(v1, v2);
        REQUIRE(collector.get_changes().size() > 1);
    }
}

TEST_CASE("unordered diff reports the same changes as stable order", "[diff][object]") {
    auto unordered = paths_of(diff(deployment_v1(), deployment_v2()));
    auto ordered = paths_of(diff(deployment_v1(), deployment_v2(), stable()));

    std::sort(unordered.begin(), unordered.end());
    REQUIRE(unordered == ordered);

    SECTION("untouched members of an edited map are skipped") {
        auto base = from_json(R"({"a": {"x": 1}, "b": {"y": 2}, "c": 3})");
        Node edited{base.as_object().set("c", NodeBox{Node{4}})};
        auto changes = diff(base, edited);
        REQUIRE(paths_of(changes) == std::vector<std::string>{"/c"});
    }
}
