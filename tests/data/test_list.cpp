// treepath_data Struct and list tests

#include <catch2/catch_test_macros.hpp>
#include <treepath/data/struct.hpp>
#include <treepath/data/list.hpp>
#include <treepath/schema/entry.hpp>

#include "../support/test_schema.hpp"

using namespace treepath_data;
using namespace treepath_test;

// =============================================================================
// Struct Tests
// =============================================================================

TEST_CASE("Struct leaves", "[data][struct]") {
    auto device = make_device();

    SECTION("set and read") {
        REQUIRE(device->set_leaf("version", Value(3)).is_ok());
        REQUIRE(device->leaf("version") == Value(std::uint64_t{3}));
    }

    SECTION("null clears") {
        REQUIRE(device->set_leaf("version", Value(3)).is_ok());
        REQUIRE(device->set_leaf("version", Value()).is_ok());
        REQUIRE(device->leaf("version").is_null());
    }

    SECTION("unknown field") {
        auto r = device->set_leaf("bogus", Value(1));
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<treepath_core::MutationError>()->kind ==
                treepath_core::MutationError::Kind::UnknownField);
    }

    SECTION("wrong value type") {
        REQUIRE(device->set_leaf("version", Value("three")).is_err());
    }

    SECTION("non-leaf field") {
        REQUIRE(device->set_leaf("system", Value(1)).is_err());
    }
}

TEST_CASE("Struct children", "[data][struct]") {
    auto device = make_device();

    REQUIRE(device->container("system") == nullptr);
    auto system = device->get_or_create_container("system");
    REQUIRE(system.is_ok());
    REQUIRE(device->container("system") == *system);
    REQUIRE(&(*system)->type() == &system_type());

    auto again = device->get_or_create_container("system");
    REQUIRE(*again == *system);

    REQUIRE(device->get_or_create_container("interfaces").is_err());
    REQUIRE(device->get_or_create_list("system").is_err());

    auto rules = device->get_or_create_list("rules");
    REQUIRE(rules.is_ok());
    REQUIRE((*rules)->ordered());
    auto interfaces = device->get_or_create_list("interfaces");
    REQUIRE(interfaces.is_ok());
    REQUIRE_FALSE((*interfaces)->ordered());

    device->clear_field("system");
    REQUIRE(device->container("system") == nullptr);
}

TEST_CASE("Struct clone and deep_equal", "[data][struct]") {
    auto device = make_populated_device();
    auto copy = device->clone();

    REQUIRE(deep_equal(*device, *copy));

    REQUIRE(copy->container("system")->leaf("hostname") == Value("router1"));
    REQUIRE(copy->container("system")->type().name == "System");

    auto* system = copy->container("system");
    REQUIRE(system->set_leaf("hostname", Value("router2")).is_ok());
    REQUIRE_FALSE(deep_equal(*device, *copy));
    REQUIRE(device->container("system")->leaf("hostname") == Value("router1"));
}

TEST_CASE("deep_equal treats an absent list as empty", "[data][struct]") {
    auto a = make_device();
    auto b = make_device();
    REQUIRE(b->get_or_create_list("interfaces").is_ok());
    REQUIRE(deep_equal(*a, *b));

    REQUIRE(b->get_or_create_container("system").is_ok());
    REQUIRE_FALSE(deep_equal(*a, *b));
}

// =============================================================================
// ListKey Tests
// =============================================================================

TEST_CASE("ListKey", "[data][list]") {
    ListKey a{{"address", Value("10.0.0.1")}, {"port", Value(179)}};
    ListKey b{{"port", Value(179)}, {"address", Value("10.0.0.1")}};

    REQUIRE(a == b);
    REQUIRE(a.get("port")->as_int() == 179);
    REQUIRE(a.get("missing") == nullptr);
    REQUIRE(a.to_string() == "address=10.0.0.1,port=179");

    auto strings = a.to_strings();
    REQUIRE(strings.is_ok());
    REQUIRE(strings->at("port") == "179");

    REQUIRE(ListKey().to_strings().is_err());
    REQUIRE(ListKey::single("name", Value()).to_strings().is_err());
}

// =============================================================================
// ListNode Tests
// =============================================================================

TEST_CASE("Keyed list lookup", "[data][list]") {
    KeyedList list(interface_type());

    auto eth1 = list.get_or_create(ListKey::single("name", Value("eth1")));
    REQUIRE(eth1.is_ok());
    REQUIRE((*eth1)->leaf("name") == Value("eth1"));
    REQUIRE(list.get_or_create(ListKey::single("name", Value("eth0"))).is_ok());

    SECTION("iteration in key order") {
        auto keys = list.keys();
        REQUIRE(keys.size() == 2);
        REQUIRE(*keys[0].get("name") == Value("eth0"));
        REQUIRE(*keys[1].get("name") == Value("eth1"));
    }

    SECTION("get_or_create returns the existing entry") {
        auto again = list.get_or_create(ListKey::single("name", Value("eth1")));
        REQUIRE(*again == *eth1);
        REQUIRE(list.size() == 2);
    }

    SECTION("find and erase") {
        REQUIRE(list.find(ListKey::single("name", Value("eth1"))) == *eth1);
        REQUIRE(list.find(ListKey::single("name", Value("eth9"))) == nullptr);
        REQUIRE(list.erase(ListKey::single("name", Value("eth1"))));
        REQUIRE_FALSE(list.erase(ListKey::single("name", Value("eth1"))));
        REQUIRE(list.size() == 1);
    }

    SECTION("wrong key shape") {
        REQUIRE(list.get_or_create(ListKey::single("index", Value("eth1"))).is_err());
        REQUIRE(list.get_or_create(ListKey{{"name", Value("a")}, {"index", Value(1)}}).is_err());
        REQUIRE(list.get_or_create(ListKey::single("name", Value(5))).is_err());
    }
}

TEST_CASE("Multi-key list", "[data][list]") {
    KeyedList list(neighbor_type());

    auto entry = list.get_or_create(ListKey{{"port", Value(179)}, {"address", Value("10.0.0.1")}});
    REQUIRE(entry.is_ok());
    REQUIRE((*entry)->leaf("port") == Value(std::uint64_t{179}));
    REQUIRE((*entry)->leaf("address") == Value("10.0.0.1"));

    auto key = list.keys().front();
    REQUIRE(key.components()[0].first == "address");
    REQUIRE(key.components()[1].first == "port");

    REQUIRE(list.find(ListKey{{"address", Value("10.0.0.1")}, {"port", Value(179)}}) == *entry);
    REQUIRE(list.find(ListKey{{"address", Value("10.0.0.1")}, {"port", Value(180)}}) == nullptr);
    REQUIRE(list.get_or_create(ListKey::single("address", Value("10.0.0.1"))).is_err());
}

TEST_CASE("List append", "[data][list]") {
    KeyedList list(interface_type());

    SECTION("entry keyed by its key leaves") {
        auto entry = Struct::make(interface_type());
        REQUIRE(entry->set_leaf("name", Value("eth0")).is_ok());
        REQUIRE(entry->set_leaf("mtu", Value(9000)).is_ok());
        auto added = list.append(std::move(entry));
        REQUIRE(added.is_ok());
        REQUIRE(list.find(ListKey::single("name", Value("eth0")))->leaf("mtu") == Value(std::uint64_t{9000}));
    }

    SECTION("duplicate key") {
        auto first = Struct::make(interface_type());
        REQUIRE(first->set_leaf("name", Value("eth0")).is_ok());
        REQUIRE(list.append(std::move(first)).is_ok());

        auto second = Struct::make(interface_type());
        REQUIRE(second->set_leaf("name", Value("eth0")).is_ok());
        auto r = list.append(std::move(second));
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<treepath_core::ValidationError>()->kind ==
                treepath_core::ValidationError::Kind::DuplicateKey);
    }

    SECTION("missing key leaf") {
        REQUIRE(list.append(Struct::make(interface_type())).is_err());
    }

    SECTION("wrong entry type") {
        REQUIRE(list.append(Struct::make(rule_type())).is_err());
    }
}

TEST_CASE("Ordered list keeps append order", "[data][list]") {
    OrderedList list(rule_type(), ListAttributes::ordered(5));

    for (int seq : {30, 10, 20}) {
        REQUIRE(list.append_new(ListKey::single("seq", Value(seq))).is_ok());
    }

    auto keys = list.keys();
    REQUIRE(keys.size() == 3);
    REQUIRE(*keys[0].get("seq") == Value(std::uint64_t{30}));
    REQUIRE(*keys[1].get("seq") == Value(std::uint64_t{10}));
    REQUIRE(*keys[2].get("seq") == Value(std::uint64_t{20}));
    REQUIRE(list.at(1)->leaf("seq") == Value(std::uint64_t{10}));
    REQUIRE(list.at(3) == nullptr);

    SECTION("lookup by key") {
        REQUIRE(list.find(ListKey::single("seq", Value(20))) == list.at(2));
    }

    SECTION("duplicate append") {
        REQUIRE(list.append_new(ListKey::single("seq", Value(10))).is_err());
    }

    SECTION("erase keeps the remaining order") {
        REQUIRE(list.erase(ListKey::single("seq", Value(10))));
        REQUIRE(list.size() == 2);
        REQUIRE(list.at(0)->leaf("seq") == Value(std::uint64_t{30}));
        REQUIRE(list.at(1)->leaf("seq") == Value(std::uint64_t{20}));
        REQUIRE(list.find(ListKey::single("seq", Value(20))) == list.at(1));
    }

    SECTION("clone keeps order") {
        auto copy = list.clone();
        REQUIRE(copy->ordered());
        auto copied = copy->keys();
        REQUIRE(copied.size() == 3);
        REQUIRE(*copied[0].get("seq") == Value(std::uint64_t{30}));
    }
}

TEST_CASE("make_list picks the implementation", "[data][list]") {
    REQUIRE(make_list(rule_type(), ListAttributes::ordered())->ordered());
    REQUIRE_FALSE(make_list(interface_type(), ListAttributes{})->ordered());
}

TEST_CASE("Embedded list key", "[data][list]") {
    auto entry = Struct::make(neighbor_type());
    REQUIRE(entry->set_leaf("address", Value("10.0.0.1")).is_ok());
    REQUIRE(entry->set_leaf("port", Value(179)).is_ok());

    auto key = entry->list_key();
    REQUIRE(key.is_ok());
    REQUIRE(key->size() == 2);
    REQUIRE(*key == ListKey{{"address", Value("10.0.0.1")}, {"port", Value(std::uint64_t{179})}});

    REQUIRE(make_device()->list_key().is_err());
}

TEST_CASE("ListAttributes from schema", "[data][list]") {
    auto servers = treepath_schema::SchemaEntry::list("server", {"address"});
    servers->with_ordered_by_user().with_min_elements(1).with_max_elements(3);

    auto attrs = ListAttributes::from_schema(*servers);
    REQUIRE(attrs.ordered_by_user);
    REQUIRE(attrs.min_elements == std::optional<std::uint64_t>{1});
    REQUIRE(attrs.max_elements == std::optional<std::uint64_t>{3});

    auto plain = ListAttributes::from_schema(*treepath_schema::SchemaEntry::list("peer", {"id"}));
    REQUIRE_FALSE(plain.ordered_by_user);
    REQUIRE_FALSE(plain.max_elements.has_value());
}
