#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "catch2/catch.hpp"

#include "config/ik_config_file.hpp"
#include "config/ik_config_plan.hpp"

using namespace ipkit;
using namespace ipkit::config;

static const char* example_plan = R"(
core:
  log:
    level: debug
pools:
  - id: office-lan
    network: 192.168.1.0/24
    reserved:
      - 192.168.1.0/28
      - 192.168.1.250 - 192.168.1.255
  - id: lab-v6
    network: 2001:db8:1::/64
routes:
  - network: 10.0.0.0/8
    next-hop: core-1
  - network: 10.1.0.0/16
    next-hop: core-2
  - network: 2001:db8::/32
    next-hop: edge-v6
)";

TEST_CASE("check configuration file functions", "[config]")
{
    SECTION("parameter lookup by path")
    {
        auto root = YAML::Load(example_plan);

        REQUIRE(file::ik_config_get_param<std::string>(root, "core.log.level")
                == "debug");
        REQUIRE(!file::ik_config_get_param<std::string>(root, "core.log.file"));
        REQUIRE(!file::ik_config_get_param(root, "core.log.level.deeper"));
        REQUIRE(file::ik_config_get_param(root, "pools")->IsSequence());
    }

    SECTION("loading files")
    {
        auto name = std::string("ipkit_test_config.yaml");
        {
            std::ofstream out(name);
            out << example_plan;
        }

        auto root = file::ik_config_load_file(name);
        REQUIRE(root);
        REQUIRE((*root)["pools"].size() == 2);
        std::remove(name.c_str());

        REQUIRE(!file::ik_config_load_file("does/not/exist.yaml"));
    }

    SECTION("loading invalid YAML")
    {
        auto name = std::string("ipkit_test_invalid.yaml");
        {
            std::ofstream out(name);
            out << "pools: [unterminated\n";
        }

        auto root = file::ik_config_load_file(name);
        REQUIRE(!root);
        REQUIRE(root.error().find(name) != std::string::npos);
        std::remove(name.c_str());
    }
}

TEST_CASE("check address plan parsing", "[config]")
{
    SECTION("a valid plan")
    {
        auto plan = ik_config_parse_plan(YAML::Load(example_plan));
        REQUIRE(plan);
        REQUIRE(plan->pools.size() == 2);
        REQUIRE(plan->routes.size() == 3);

        auto pool = ik_config_find_pool(*plan, "office-lan");
        REQUIRE(pool);
        REQUIRE(to_string(pool->reserved)
                == "192.168.1.0-192.168.1.15, 192.168.1.250-192.168.1.255");
        REQUIRE(!ik_config_find_pool(*plan, "missing"));
    }

    SECTION("an empty document is an empty plan")
    {
        auto plan = ik_config_parse_plan(YAML::Load(""));
        REQUIRE(plan);
        REQUIRE(plan->pools.empty());
        REQUIRE(plan->routes.empty());
    }

    SECTION("invalid plans name the offending entry")
    {
        auto error_of = [](const char* yaml) {
            auto plan = ik_config_parse_plan(YAML::Load(yaml));
            REQUIRE(!plan);
            return (plan.error());
        };

        REQUIRE(error_of("pools: 3").find("pools") != std::string::npos);
        REQUIRE(error_of("pools:\n  - id: Bad_Id\n    network: 10.0.0.0/8")
                    .find("Bad_Id")
                != std::string::npos);
        REQUIRE(error_of("pools:\n  - id: a\n    network: 10.0.0.0/8\n"
                         "  - id: a\n    network: 10.1.0.0/16")
                    .find("Duplicate")
                != std::string::npos);
        REQUIRE(error_of("pools:\n  - id: a\n    network: 10.0.0.0/33")
                    .find("Pool a")
                != std::string::npos);
        REQUIRE(error_of("pools:\n  - id: a\n    network: 10.0.0.0/24\n"
                         "    reserved: [10.0.1.1]")
                    .find("outside")
                != std::string::npos);
        REQUIRE(error_of("pools:\n  - id: a\n    network: 10.0.0.0/24\n"
                         "    reserved: ['::1']")
                    .find("Pool a")
                != std::string::npos);
        REQUIRE(error_of("pools:\n  - network: 10.0.0.0/24")
                    .find("missing an id")
                != std::string::npos);
        REQUIRE(error_of("routes:\n  - network: 10.0.0.0/8")
                    .find("next-hop")
                != std::string::npos);
        REQUIRE(error_of("routes:\n  - network: 10.0.0/8\n    next-hop: a")
                    .find("Route 0")
                != std::string::npos);
    }
}

TEST_CASE("check pool id validation", "[config]")
{
    auto parse_id = [](const std::string& id) {
        return (ik_config_parse_plan(YAML::Load(
            "pools:\n  - id: \"" + id + "\"\n    network: 10.0.0.0/24")));
    };

    // clang-format off
    std::vector<std::string> valid_ids {
        "office-lan",
        "lan",
        "dc1-mgmt",
        "vlan-34",
        "0x2"};
    // clang-format on
    for (const auto& id : valid_ids) {
        auto plan = parse_id(id);
        REQUIRE(plan);
        REQUIRE(plan->pools.front().id == id);
    }

    // clang-format off
    std::vector<std::string> invalid_ids {
        "Office",
        "lan.2",
        "dc1_mgmt",
        "vlan/34",
        "pool@2",
        "-lan",
        "lan-",
        ""};
    // clang-format on
    for (const auto& id : invalid_ids) {
        auto plan = parse_id(id);
        REQUIRE(!plan);
        REQUIRE(!plan.error().empty());
    }
}

TEST_CASE("check objects built from a plan", "[config]")
{
    auto plan = ik_config_parse_plan(YAML::Load(example_plan));
    REQUIRE(plan);

    SECTION("allocators start with reserved addresses taken")
    {
        auto allocator =
            ik_config_make_allocator(*ik_config_find_pool(*plan, "office-lan"));
        REQUIRE(allocator.allocate_next() == net::ip_address("192.168.1.16"));
        REQUIRE(allocator.available_count() == net::address_count{233});
    }

    SECTION("route tables")
    {
        auto tables = ik_config_make_route_tables(plan->routes);
        REQUIRE(tables.ipv4.size() == 2);
        REQUIRE(tables.ipv6.size() == 1);

        REQUIRE(tables.lookup(net::ip_address("10.1.2.3"))->value == "core-2");
        REQUIRE(tables.lookup(net::ip_address("10.2.2.3"))->value == "core-1");
        REQUIRE(tables.lookup(net::ip_address("2001:db8:5::1"))->value
                == "edge-v6");
        REQUIRE(!tables.lookup(net::ip_address("192.0.2.1")));
    }
}
