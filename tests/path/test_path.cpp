// treepath_path Path tests

#include <catch2/catch_test_macros.hpp>
#include <treepath/path/path.hpp>

using namespace treepath_path;
using treepath_core::ErrorCode;

// =============================================================================
// Formatting
// =============================================================================

TEST_CASE("Path to_string", "[path]") {
    SECTION("empty path") {
        REQUIRE(Path().to_string() == "/");
    }

    SECTION("plain names") {
        REQUIRE(Path::from_names({"system", "config", "hostname"}).to_string() == "/system/config/hostname");
    }

    SECTION("keys in name order") {
        Path p{PathElem("neighbors"), PathElem("neighbor", {{"port", "179"}, {"address", "10.0.0.1"}})};
        REQUIRE(p.to_string() == "/neighbors/neighbor[address=10.0.0.1][port=179]");
    }

    SECTION("escaped key values") {
        PathElem elem("interface", {{"name", "a]b\\c"}});
        REQUIRE(elem.to_string() == "interface[name=a\\]b\\\\c]");
    }

    SECTION("origin is not rendered") {
        Path p(std::vector<PathElem>{PathElem("a")}, "openconfig");
        REQUIRE(p.to_string() == "/a");
    }
}

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("Path parse", "[path]") {
    SECTION("plain") {
        auto p = Path::parse("/interfaces/interface/config/mtu");
        REQUIRE(p.is_ok());
        REQUIRE(p->size() == 4);
        REQUIRE(p->elems[3].name == "mtu");
    }

    SECTION("leading slash optional") {
        auto p = Path::parse("system/config");
        REQUIRE(p.is_ok());
        REQUIRE(*p == Path::from_names({"system", "config"}));
    }

    SECTION("root") {
        REQUIRE(Path::parse("")->empty());
        REQUIRE(Path::parse("/")->empty());
    }

    SECTION("keys") {
        auto p = Path::parse("/neighbors/neighbor[address=10.0.0.1][port=179]/peer-as");
        REQUIRE(p.is_ok());
        const auto& keys = p->elems[1].keys;
        REQUIRE(keys.size() == 2);
        REQUIRE(keys.at("address") == "10.0.0.1");
        REQUIRE(keys.at("port") == "179");
    }

    SECTION("slash inside a key value") {
        auto p = Path::parse("/interfaces/interface[name=Ethernet1/1]/state");
        REQUIRE(p.is_ok());
        REQUIRE(p->size() == 3);
        REQUIRE(p->elems[1].keys.at("name") == "Ethernet1/1");
    }

    SECTION("escaped bracket survives formatting") {
        Path original{PathElem("interface", {{"name", "x]y"}})};
        auto p = Path::parse(original.to_string());
        REQUIRE(p.is_ok());
        REQUIRE(*p == original);
    }

    SECTION("malformed") {
        for (const char* text : {"/a//b", "/a[k=v", "/a[kv]", "/a[=v]", "/a[k=1][k=2]", "/a[k=v]x"}) {
            auto p = Path::parse(text);
            REQUIRE(p.is_err());
            REQUIRE(p.error().code() == ErrorCode::ParseError);
        }
    }
}

// =============================================================================
// Composition
// =============================================================================

TEST_CASE("Path composition", "[path]") {
    Path base = Path::from_names({"interfaces"});

    SECTION("child") {
        Path p = base.child(PathElem("interface", {{"name", "eth0"}}));
        REQUIRE(p.to_string() == "/interfaces/interface[name=eth0]");
        REQUIRE(base.size() == 1);
    }

    SECTION("has_prefix") {
        Path p = Path::from_names({"interfaces", "interface", "name"});
        REQUIRE(p.has_prefix(base));
        REQUIRE(p.has_prefix(Path()));
        REQUIRE_FALSE(base.has_prefix(p));
        REQUIRE_FALSE(p.has_prefix(Path::from_names({"system"})));
    }

    SECTION("join") {
        auto p = join_paths(base, Path::from_names({"interface"}));
        REQUIRE(p.is_ok());
        REQUIRE(p->to_string() == "/interfaces/interface");
    }

    SECTION("join keeps the prefix origin") {
        Path prefix(std::vector<PathElem>{PathElem("a")}, "openconfig");
        auto p = join_paths(prefix, Path::from_names({"b"}));
        REQUIRE(p.is_ok());
        REQUIRE(p->origin == "openconfig");
    }

    SECTION("conflicting origins") {
        Path prefix(std::vector<PathElem>{PathElem("a")}, "openconfig");
        Path path(std::vector<PathElem>{PathElem("b")}, "cli");
        auto p = join_paths(prefix, path);
        REQUIRE(p.is_err());
        REQUIRE(p.error().as<treepath_core::MutationError>()->kind == treepath_core::MutationError::Kind::PrefixJoin);
    }

    SECTION("ordering") {
        REQUIRE(Path::from_names({"a"}) < Path::from_names({"b"}));
        REQUIRE(Path{PathElem("a", {{"k", "1"}})} < Path{PathElem("a", {{"k", "2"}})});
    }
}
