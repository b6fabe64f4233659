// treepath_data list validation tests

#include <catch2/catch_test_macros.hpp>
#include <treepath/data/validation.hpp>

#include "../support/test_schema.hpp"

using namespace treepath_data;
using namespace treepath_test;
using Kind = treepath_core::ValidationError::Kind;

namespace {

DataNode* interface_entry(DataNode& device, const char* name) {
    return device.list("interfaces")->find(ListKey::single("name", Value(name)));
}

} // namespace

TEST_CASE("Valid trees pass", "[data][validation]") {
    auto device = make_populated_device();
    auto result = validate_tree(*device);
    REQUIRE(result.valid);
    REQUIRE(result.issues.empty());
    REQUIRE(validate(*device).is_ok());
}

TEST_CASE("Key leaf changed after insertion", "[data][validation]") {
    auto device = make_populated_device();
    REQUIRE(interface_entry(*device, "eth1")->set_leaf("name", Value("eth7")).is_ok());

    auto result = validate_list(*device->list("interfaces"), "/interfaces/interface");
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.has(Kind::KeyMismatch));
    REQUIRE(result.issues.front().path == "/interfaces/interface[name=eth1]");
}

TEST_CASE("Second key leaf changed after insertion", "[data][validation]") {
    auto device = make_device();
    auto neighbors = device->get_or_create_list("neighbors");
    REQUIRE(neighbors.is_ok());
    auto peer = (*neighbors)->get_or_create(ListKey{{"address", Value("10.0.0.1")}, {"port", Value(179)}});
    REQUIRE(peer.is_ok());
    REQUIRE(validate(*device).is_ok());

    REQUIRE((*peer)->set_leaf("port", Value(1179)).is_ok());

    auto result = validate_tree(*device);
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.has(Kind::KeyMismatch));
    REQUIRE_FALSE(result.has(Kind::MissingKey));
    REQUIRE(result.issues.front().path == "/neighbors/neighbor[address=10.0.0.1,port=179]");
}

TEST_CASE("Two entries with one embedded key", "[data][validation]") {
    auto device = make_populated_device();
    REQUIRE(interface_entry(*device, "eth1")->set_leaf("name", Value("eth0")).is_ok());

    auto result = validate_tree(*device);
    REQUIRE(result.has(Kind::DuplicateKey));
    REQUIRE(result.has(Kind::KeyMismatch));
}

TEST_CASE("Unset key leaf", "[data][validation]") {
    auto device = make_populated_device();
    interface_entry(*device, "eth0")->clear_field("name");

    auto result = validate_tree(*device);
    REQUIRE(result.has(Kind::MissingKey));
    REQUIRE(result.first_error().find("name") != std::string::npos);

    auto checked = validate(*device);
    REQUIRE(checked.is_err());
    REQUIRE(checked.error().code() == treepath_core::ErrorCode::ValidationError);
    REQUIRE(checked.error().get_context("issues") != nullptr);
}

TEST_CASE("List cardinality", "[data][validation]") {
    SECTION("above maximum") {
        OrderedList rules(rule_type(), ListAttributes::ordered(2));
        for (int seq : {1, 2, 3}) {
            REQUIRE(rules.append_new(ListKey::single("seq", Value(seq))).is_ok());
        }
        auto result = validate_list(rules, "/rules/rule");
        REQUIRE(result.has(Kind::Cardinality));
        REQUIRE(result.issues.size() == 1);
    }

    SECTION("at maximum") {
        OrderedList rules(rule_type(), ListAttributes::ordered(5));
        for (int seq = 1; seq <= 5; ++seq) {
            REQUIRE(rules.append_new(ListKey::single("seq", Value(seq * 10))).is_ok());
        }
        REQUIRE(validate_list(rules, "/rules/rule").valid);

        REQUIRE(rules.append_new(ListKey::single("seq", Value(60))).is_ok());
        auto result = validate_list(rules, "/rules/rule");
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.has(Kind::Cardinality));
        REQUIRE(result.first_error() == "/rules/rule: has 6 elements, maximum is 5");
    }

    SECTION("below minimum") {
        ListAttributes attrs;
        attrs.min_elements = 1;
        KeyedList interfaces(interface_type(), attrs);
        auto result = validate_list(interfaces, "/interfaces/interface");
        REQUIRE(result.has(Kind::Cardinality));
        REQUIRE(result.to_error().as<treepath_core::ValidationError>()->path == "/interfaces/interface");
    }
}

TEST_CASE("Nested lists are validated", "[data][validation]") {
    auto device = make_device();
    auto system = device->get_or_create_container("system");
    REQUIRE(system.is_ok());
    auto servers = (*system)->get_or_create_list("servers");
    REQUIRE(servers.is_ok());
    auto server = (*servers)->get_or_create(ListKey::single("address", Value("ntp1")));
    REQUIRE(server.is_ok());
    REQUIRE((*server)->set_leaf("address", Value("ntp2")).is_ok());

    auto result = validate_tree(*device);
    REQUIRE(result.has(Kind::KeyMismatch));
    REQUIRE(result.issues.front().path == "/system/server[address=ntp1]");
}

TEST_CASE("ValidationResult merge", "[data][validation]") {
    ValidationResult a = ValidationResult::ok();
    ValidationResult b;
    b.add_issue(Kind::MissingKey, "/x", "missing key field name");

    a.merge(b);
    REQUIRE_FALSE(a.valid);
    REQUIRE(a.issues.size() == 1);
    REQUIRE(a.first_error().find("/x") != std::string::npos);
}
