#include <cstring>
#include <string>
#include <vector>

#include "catch2/catch.hpp"

#include "core/ik_log.h"

TEST_CASE("check log level setter/getter", "[logging]")
{
    auto saved_level = ik_log_level_get();
    for (int level = IK_LOG_NONE; level < IK_LOG_MAX; level++) {
        ik_log_level_set(static_cast<enum ik_log_level>(level));
        REQUIRE(ik_log_level_get() == level);
    }
    ik_log_level_set(saved_level);
}

TEST_CASE("check log message output", "[logging]")
{
    REQUIRE(ik_log(IK_LOG_CRITICAL, __PRETTY_FUNCTION__,
                   "This is a critical message\n")
            == 0);
    REQUIRE(ik_log(IK_LOG_WARNING, __PRETTY_FUNCTION__,
                   "This is a warning message without a newline")
            == 0);
    REQUIRE(ik_log(IK_LOG_ERROR, nullptr, "Formatted %d %s", 42, "value")
            == 0);
    REQUIRE(ik_log_signed(IK_LOG_ERROR,
                          "bool ipkit::net::operator<(const "
                          "ipkit::net::ip_address&, const "
                          "ipkit::net::ip_address&)",
                          "Tagged %s",
                          "message")
            == 0);

    REQUIRE(strcmp(ik_log_level_name(IK_LOG_DEBUG), "debug") == 0);
    REQUIRE(strcmp(ik_log_level_name(IK_LOG_MAX), "unknown") == 0);
}

TEST_CASE("check log macro argument evaluation", "[logging]")
{
    auto saved_level = ik_log_level_get();
    int evaluated = 0;
    auto count = [&]() { return (++evaluated); };

    ik_log_level_set(IK_LOG_WARNING);
    IK_LOG(IK_LOG_DEBUG, "skipped %d", count());
    REQUIRE(evaluated == 0);

    IK_LOG(IK_LOG_ERROR, "written %d", count());
    REQUIRE(evaluated == 1);

    ik_log_level_set(saved_level);
}

TEST_CASE("check log level argument parsing", "[logging]")
{
    SECTION("levels by number")
    {
        REQUIRE(parse_log_optarg("2") == IK_LOG_ERROR);
        REQUIRE(parse_log_optarg("6") == IK_LOG_TRACE);
        REQUIRE(parse_log_optarg("0") == IK_LOG_NONE);
        REQUIRE(parse_log_optarg("9") == IK_LOG_NONE);
    }

    SECTION("levels by name in any case")
    {
        REQUIRE(parse_log_optarg("warning") == IK_LOG_WARNING);
        REQUIRE(parse_log_optarg("DEBUG") == IK_LOG_DEBUG);
        REQUIRE(parse_log_optarg("Trace") == IK_LOG_TRACE);
        REQUIRE(parse_log_optarg("critical") == IK_LOG_CRITICAL);
    }

    SECTION("unknown and missing levels")
    {
        REQUIRE(parse_log_optarg("verbose") == IK_LOG_NONE);
        REQUIRE(parse_log_optarg("criticality") == IK_LOG_NONE);
        REQUIRE(parse_log_optarg("") == IK_LOG_NONE);
        REQUIRE(parse_log_optarg(nullptr) == IK_LOG_NONE);
    }
}

TEST_CASE("check logging function signature --> string function", "[logging]")
{
    /* input, expected output pairs */
    std::vector<std::pair<const char*, const char*>> signatures = {
        {"int simple_function()", "simple_function"},
        {"unsigned int ns::simple()", "ns::simple"},
        {"std::vector<int>& crazy()", "crazy"},
        {"void some::class<some::type_a, some::type_b>::function(int x)",
         "some::class<some::type_a, some::type_b>::function"},
        {"void some::class<some::type_a, some::type_b>::function(int x) [CLASS "
         "= some::other_class]",
         "some::class<some::type_a, some::type_b>::function"},
        {"bool ipkit::net::address_allocator::allocate_address(const "
         "ipkit::net::ip_address&)",
         "ipkit::net::address_allocator::allocate_address"},
        {"void ipkit::net::radix_trie<T>::insert(const ipkit::net::ip_network&, "
         "T) [with T = std::__cxx11::basic_string<char>]",
         "ipkit::net::radix_trie<T>::insert"}};

    for (auto& pair : signatures) {
        std::vector<char> output(strlen(pair.first) + 1);
        ik_log_function_name(pair.first, output.data());
        REQUIRE(strcmp(output.data(), pair.second) == 0);
    }
}

TEST_CASE("check operator signatures --> string function", "[logging]")
{
    std::vector<std::pair<const char*, const char*>> signatures = {
        {"std::ostream& ipkit::net::operator<<(std::ostream&, const "
         "ipkit::net::ip_address&)",
         "ipkit::net::operator<<"},
        {"bool ipkit::net::operator<(const ipkit::net::ip_address&, const "
         "ipkit::net::ip_address&)",
         "ipkit::net::operator<"},
        {"bool ipkit::net::operator>=(const ipkit::net::ip_network&, const "
         "ipkit::net::ip_network&)",
         "ipkit::net::operator>="},
        {"const T* holder<T>::operator->() const [with T = int]",
         "holder<T>::operator->"},
        {"size_t std::hash<ipkit::net::ip_address>::operator()(const "
         "ipkit::net::ip_address&) const",
         "std::hash<ipkit::net::ip_address>::operator()"},
        {"ns::holder::operator bool() const", "ns::holder::operator bool"},
        {"void ns::my_operator(int)", "ns::my_operator"}};

    for (auto& pair : signatures) {
        std::vector<char> output(strlen(pair.first) + 1);
        ik_log_function_name(pair.first, output.data());
        REQUIRE(std::string(output.data()) == pair.second);
    }
}
