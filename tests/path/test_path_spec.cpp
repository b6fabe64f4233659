// treepath_path PathSpec and tree walk tests

#include <catch2/catch_test_macros.hpp>
#include <treepath/path/path_spec.hpp>

#include "../support/test_schema.hpp"

#include <nlohmann/json.hpp>

#include <set>

using namespace treepath_path;
using namespace treepath_data;
using namespace treepath_test;

namespace {

std::set<std::string> strings_of(const PathSpec& spec) {
    std::set<std::string> out;
    for (const auto& p : spec.paths()) {
        out.insert(p.to_string());
    }
    return out;
}

} // namespace

// =============================================================================
// PathSpec Algebra
// =============================================================================

TEST_CASE("PathSpec child", "[path][spec]") {
    SECTION("from the root") {
        auto spec = PathSpec::root().child(parse_schema_paths("name|config/name"), "name");
        REQUIRE(spec.is_ok());
        REQUIRE(strings_of(*spec) == std::set<std::string>{"/name", "/config/name"});
    }

    SECTION("cartesian product") {
        PathSpec parent(std::vector<Path>{Path::from_names({"a"}), Path::from_names({"b"})});
        auto spec = parent.child(parse_schema_paths("x|y/z"), "field");
        REQUIRE(spec.is_ok());
        REQUIRE(spec->size() == 4);
        REQUIRE(strings_of(*spec) == std::set<std::string>{"/a/x", "/a/y/z", "/b/x", "/b/y/z"});
    }

    SECTION("unaddressed parent") {
        auto spec = PathSpec().child(parse_schema_paths("x"), "x");
        REQUIRE(spec.is_err());
        REQUIRE(spec.error().as<treepath_core::PathError>()->kind == treepath_core::PathError::Kind::MissingParent);
    }
}

TEST_CASE("PathSpec list_entry", "[path][spec]") {
    PathSpec list(std::vector<Path>{Path::from_names({"interfaces", "interface"})});

    SECTION("keys on the last element") {
        auto spec = list.list_entry(ListKey::single("name", Value("eth0")), "interfaces");
        REQUIRE(spec.is_ok());
        REQUIRE(spec->representative().to_string() == "/interfaces/interface[name=eth0]");
    }

    SECTION("multiple keys") {
        auto spec = list.list_entry(ListKey{{"address", Value("10.0.0.1")}, {"port", Value(179)}}, "n");
        REQUIRE(spec.is_ok());
        REQUIRE(spec->representative().elems.back().keys.size() == 2);
    }

    SECTION("unset key") {
        REQUIRE(list.list_entry(ListKey::single("name", Value()), "interfaces").is_err());
        REQUIRE(list.list_entry(ListKey(), "interfaces").is_err());
    }

    SECTION("no parent element") {
        REQUIRE(PathSpec::root().list_entry(ListKey::single("name", Value("eth0")), "x").is_err());
    }
}

TEST_CASE("PathSpec identity", "[path][spec]") {
    PathSpec a(std::vector<Path>{Path::from_names({"name"}), Path::from_names({"config", "name"})});
    PathSpec b(std::vector<Path>{Path::from_names({"config", "name"}), Path::from_names({"name"})});

    REQUIRE(a == b);
    REQUIRE(a.canonical_key() == b.canonical_key());
    REQUIRE(a.canonical_key() == "/config/name|/name");
    REQUIRE(a != PathSpec(std::vector<Path>{Path::from_names({"name"})}));
}

TEST_CASE("least_specific_path", "[path][spec]") {
    REQUIRE(least_specific_path(parse_schema_paths("config/name|name")) == SchemaPath{"name"});
    REQUIRE(least_specific_path(parse_schema_paths("a/x|b/y")) == SchemaPath{"a", "x"});
    REQUIRE(least_specific_path({}).empty());
}

TEST_CASE("field_schema_paths", "[path][spec]") {
    const FieldDescriptor& mtu = *interface_type().find_field("mtu");
    const FieldDescriptor& name = *interface_type().find_field("name");

    SECTION("primary paths by default") {
        auto paths = field_schema_paths(mtu, {});
        REQUIRE(paths.is_ok());
        REQUIRE(*paths == std::vector<SchemaPath>{{"state", "mtu"}});
    }

    SECTION("shadow paths when preferred") {
        PathOptions options;
        options.prefer_shadow_path = true;
        REQUIRE(*field_schema_paths(mtu, options) == std::vector<SchemaPath>{{"config", "mtu"}});
        // No shadow declared: primary paths are used
        REQUIRE(field_schema_paths(name, options)->size() == 2);
    }

    SECTION("single path") {
        PathOptions options;
        options.map_to_single_path = true;
        REQUIRE(*field_schema_paths(name, options) == std::vector<SchemaPath>{{"name"}});
    }

    SECTION("no declared path") {
        FieldDescriptor bare;
        bare.name = "bare";
        REQUIRE(field_schema_paths(bare, {}).is_err());
    }
}

TEST_CASE("PathOptions from_json", "[path][spec]") {
    auto options = PathOptions::from_json(nlohmann::json{{"prefer_shadow_path", true}});
    REQUIRE(options.is_ok());
    REQUIRE(options->prefer_shadow_path);
    REQUIRE_FALSE(options->map_to_single_path);

    REQUIRE(PathOptions::from_json(nlohmann::json{{"shadow", true}}).is_err());
    REQUIRE(PathOptions::from_json(nlohmann::json{{"map_to_single_path", 1}}).is_err());
}

// =============================================================================
// Tree Walks
// =============================================================================

TEST_CASE("walk_tree reports every leaf field", "[path][walk]") {
    auto device = make_populated_device();
    PathWalk walk;
    std::set<std::string> seen;
    std::size_t set_leaves = 0;

    auto result = walk_tree(*device, walk, [&](const FieldRef& ref, const PathSpec& spec) -> treepath_core::Result<void> {
        for (const auto& p : spec.paths()) {
            seen.insert(p.to_string());
        }
        if (ref.value != nullptr && ref.value->is_set()) {
            ++set_leaves;
        }
        return treepath_core::Ok();
    });
    REQUIRE(result.is_ok());

    REQUIRE(seen.count("/version") == 1);
    REQUIRE(seen.count("/system/config/hostname") == 1);
    REQUIRE(seen.count("/interfaces/interface[name=eth0]/name") == 1);
    REQUIRE(seen.count("/interfaces/interface[name=eth0]/config/name") == 1);
    REQUIRE(seen.count("/interfaces/interface[name=eth0]/state/mtu") == 1);
    REQUIRE(seen.count("/interfaces/interface[name=eth0]/config/mtu") == 0);
    REQUIRE(seen.count("/rules/rule[seq=10]/action") == 1);
    // Empty and absent lists are not visited
    REQUIRE(seen.count("/neighbors/neighbor") == 0);

    // hostname, eth0 name + mtu, eth1 name, two rules with seq + action
    REQUIRE(set_leaves == 8);
}

TEST_CASE("walk_tree stops at the first visitor error", "[path][walk]") {
    auto device = make_populated_device();
    PathWalk walk;
    int calls = 0;
    auto result = walk_tree(*device, walk, [&](const FieldRef&, const PathSpec&) -> treepath_core::Result<void> {
        ++calls;
        return treepath_core::Err(treepath_core::Error(treepath_core::ErrorCode::InvalidState, "stop"));
    });
    REQUIRE(result.is_err());
    REQUIRE(calls == 1);
}

TEST_CASE("node_path_spec", "[path][walk]") {
    auto device = make_populated_device();
    const DataNode* eth0 = device->list("interfaces")->find(ListKey::single("name", Value("eth0")));
    REQUIRE(eth0 != nullptr);

    SECTION("list entry") {
        auto spec = node_path_spec(*device, *eth0);
        REQUIRE(spec.is_ok());
        REQUIRE(spec->size() == 1);
        REQUIRE(spec->representative().to_string() == "/interfaces/interface[name=eth0]");
    }

    SECTION("root") {
        auto spec = node_path_spec(*device, *device);
        REQUIRE(spec.is_ok());
        REQUIRE(spec->representative().empty());
    }

    SECTION("node outside the tree") {
        auto other = make_device();
        REQUIRE(node_path_spec(*device, *other).is_err());
    }
}
