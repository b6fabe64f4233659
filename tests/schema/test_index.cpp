// treepath_schema SchemaIndex and leafref tests

#include <catch2/catch_test_macros.hpp>
#include <treepath/schema/index.hpp>

#include <algorithm>

using namespace treepath_schema;
using treepath_core::SchemaError;

namespace {

/// mod
///   interfaces/interface[name]
///     name -> ../config/name
///     config/{name, mtu}
///     subinterfaces/subinterface[index]
///       index -> ../config/index
///       config/index
///   transport (choice) / tcp (case) / port
///   primary -> /oc-if:interfaces/oc-if:interface/oc-if:config/oc-if:name
std::unique_ptr<SchemaEntry> make_module() {
    auto mod = SchemaEntry::module("mod");
    auto& interface = mod->add(SchemaEntry::container("interfaces"))
                          .add(SchemaEntry::list("interface", {"name"}));
    interface.add(SchemaEntry::leafref("name", "../config/name"));
    auto& config = interface.add(SchemaEntry::container("config"));
    config.add(SchemaEntry::leaf("name"));
    config.add(SchemaEntry::leaf("mtu", "uint16"));

    auto& sub = interface.add(SchemaEntry::container("subinterfaces"))
                    .add(SchemaEntry::list("subinterface", {"index"}));
    sub.add(SchemaEntry::leafref("index", "../config/index"));
    sub.add(SchemaEntry::container("config")).add(SchemaEntry::leaf("index", "uint32"));

    mod->add(SchemaEntry::choice("transport"))
        .add(SchemaEntry::case_("tcp"))
        .add(SchemaEntry::leaf("port", "uint16"));
    mod->add(SchemaEntry::leafref("primary", "/oc-if:interfaces/oc-if:interface/oc-if:config/oc-if:name"));
    return mod;
}

} // namespace

// =============================================================================
// XPath Helpers
// =============================================================================

TEST_CASE("split_xpath_parts", "[schema][index]") {
    SECTION("absolute path") {
        auto parts = split_xpath_parts("/a/b/c");
        REQUIRE(parts == std::vector<std::string>{"", "a", "b", "c"});
    }

    SECTION("predicates are dropped") {
        auto parts = split_xpath_parts("/a/b[name=current()/../x/y]/c");
        REQUIRE(parts == std::vector<std::string>{"", "a", "b", "c"});
    }

    SECTION("relative path") {
        auto parts = split_xpath_parts("../../config/name");
        REQUIRE(parts == std::vector<std::string>{"..", "..", "config", "name"});
    }
}

TEST_CASE("remove_xpath_namespaces", "[schema][index]") {
    SECTION("prefixes stripped") {
        auto parts = remove_xpath_namespaces({"", "oc:a", "b", "oc:c"});
        REQUIRE(parts.is_ok());
        REQUIRE(*parts == std::vector<std::string>{"", "a", "b", "c"});
    }

    SECTION("two prefixes in one element") {
        auto parts = remove_xpath_namespaces({"a:b:c"});
        REQUIRE(parts.is_err());
        REQUIRE(parts.error().as<SchemaError>()->kind == SchemaError::Kind::InvalidPath);
    }
}

TEST_CASE("fix_schema_tree_path", "[schema][index]") {
    auto mod = make_module();
    const SchemaEntry* interface = mod->find_child("interfaces")->find_child("interface");
    const SchemaEntry* name = interface->find_child("name");

    SECTION("absolute path drops the leading separator") {
        auto key = fix_schema_tree_path("/oc:a/oc:b", nullptr);
        REQUIRE(key.is_ok());
        REQUIRE(*key == std::vector<std::string>{"a", "b"});
    }

    SECTION("relative path walks up from the caller") {
        auto key = fix_schema_tree_path("../config/name", name);
        REQUIRE(key.is_ok());
        REQUIRE(*key == std::vector<std::string>{"interfaces", "interface", "config", "name"});
    }

    SECTION("several parent steps") {
        auto key = fix_schema_tree_path("../../../interfaces/interface/config/mtu", name);
        REQUIRE(key.is_ok());
        REQUIRE(*key == std::vector<std::string>{"interfaces", "interface", "config", "mtu"});
    }

    SECTION("above the root") {
        auto key = fix_schema_tree_path("../../../../x", name);
        REQUIRE(key.is_err());
        REQUIRE(key.error().as<SchemaError>()->kind == SchemaError::Kind::AboveRoot);
    }

    SECTION("module as caller") {
        auto key = fix_schema_tree_path("../x", mod.get());
        REQUIRE(key.is_err());
        REQUIRE(key.error().as<SchemaError>()->kind == SchemaError::Kind::ModuleContext);
    }

    SECTION("no caller") {
        auto key = fix_schema_tree_path("../x", nullptr);
        REQUIRE(key.is_err());
        REQUIRE(key.error().as<SchemaError>()->kind == SchemaError::Kind::ModuleContext);
    }

    SECTION("neither absolute nor relative") {
        auto key = fix_schema_tree_path("config/name", name);
        REQUIRE(key.is_err());
        REQUIRE(key.error().as<SchemaError>()->kind == SchemaError::Kind::InvalidPath);
    }

    SECTION("empty path") {
        REQUIRE(fix_schema_tree_path("", name).is_err());
    }
}

// =============================================================================
// SchemaIndex
// =============================================================================

TEST_CASE("SchemaIndex build", "[schema][index]") {
    auto mod = make_module();
    auto index = SchemaIndex::build_from_modules({mod.get()});
    REQUIRE(index.is_ok());

    SECTION("leaves are registered by data path") {
        REQUIRE(index->size() == 7);
        REQUIRE(index->find({"interfaces", "interface", "config", "mtu"}) != nullptr);
        REQUIRE(index->find({"interfaces", "interface", "subinterfaces", "subinterface", "index"}) != nullptr);
        REQUIRE(index->find({"primary"}) != nullptr);
    }

    SECTION("choice and case are not part of the key") {
        const SchemaEntry* port = index->find({"port"});
        REQUIRE(port != nullptr);
        REQUIRE(port->name() == "port");
        REQUIRE(index->find({"transport", "tcp", "port"}) == nullptr);
    }

    SECTION("directories are not registered") {
        REQUIRE(index->find({"interfaces", "interface"}) == nullptr);
        REQUIRE(index->find({"interfaces", "interface", "config"}) == nullptr);
    }

    SECTION("keys are sorted") {
        auto keys = index->keys();
        REQUIRE(keys.size() == index->size());
        REQUIRE(std::is_sorted(keys.begin(), keys.end()));
    }
}

TEST_CASE("SchemaIndex build skips non-root entries", "[schema][index]") {
    auto mod = make_module();
    const SchemaEntry* interfaces = mod->find_child("interfaces");
    const SchemaEntry* interface = interfaces->find_child("interface");

    auto index = SchemaIndex::build({interface, interfaces});
    REQUIRE(index.is_ok());
    // "interface" sits at /mod/interfaces/interface and is skipped; its
    // leaves come in through "interfaces"
    REQUIRE(index->size() == 5);
}

TEST_CASE("SchemaIndex rejects non-modules", "[schema][index]") {
    auto mod = make_module();
    auto index = SchemaIndex::build_from_modules({mod->find_child("interfaces")});
    REQUIRE(index.is_err());
}

TEST_CASE("Leafref resolution", "[schema][index]") {
    auto mod = make_module();
    auto index = SchemaIndex::build_from_modules({mod.get()});
    REQUIRE(index.is_ok());

    const SchemaEntry* interface = mod->find_child("interfaces")->find_child("interface");
    const SchemaEntry* config_name = interface->find_child("config")->find_child("name");

    SECTION("relative leafref") {
        auto target = index->resolve_leafref(*interface->find_child("name"));
        REQUIRE(target.is_ok());
        REQUIRE(*target == config_name);
    }

    SECTION("nested relative leafref") {
        const SchemaEntry* sub = interface->find_child("subinterfaces")->find_child("subinterface");
        auto target = index->resolve_leafref(*sub->find_child("index"));
        REQUIRE(target.is_ok());
        REQUIRE(*target == sub->find_child("config")->find_child("index"));
    }

    SECTION("absolute leafref with prefixes") {
        auto target = index->resolve_leafref(*mod->find_child("primary"));
        REQUIRE(target.is_ok());
        REQUIRE(*target == config_name);
    }

    SECTION("unregistered target") {
        auto target = index->resolve_leafref_target("/interfaces/interface/config/speed", nullptr);
        REQUIRE(target.is_err());
        REQUIRE(target.error().as<SchemaError>()->kind == SchemaError::Kind::Unregistered);
        REQUIRE(target.error().code() == treepath_core::ErrorCode::NotFound);
    }

    SECTION("not a leafref") {
        auto target = index->resolve_leafref(*config_name);
        REQUIRE(target.is_err());
        REQUIRE(target.error().as<SchemaError>()->kind == SchemaError::Kind::NotLeafref);
    }
}

TEST_CASE("SchemaIndex duplicate registration", "[schema][index]") {
    auto a = SchemaEntry::module("a");
    a->add(SchemaEntry::container("top")).add(SchemaEntry::leaf("x"));
    auto b = SchemaEntry::module("b");
    b->add(SchemaEntry::container("top")).add(SchemaEntry::leaf("x"));

    auto index = SchemaIndex::build_from_modules({a.get(), b.get()});
    REQUIRE(index.is_err());
    REQUIRE(index.error().as<SchemaError>()->kind == SchemaError::Kind::DuplicatePath);
}
