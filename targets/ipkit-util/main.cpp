#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <getopt.h>
#include <strings.h>

#include "config/ik_config_file.hpp"
#include "config/ik_config_plan.hpp"
#include "core/ik_log.h"
#include "net/errors.hpp"
#include "net/json.hpp"
#include "net/ptr.hpp"
#include "net/range_set.hpp"

using namespace ipkit;

/**
 * Global parameters
 */

static std::string config_file;
static bool json_output = false;
static std::optional<unsigned> min_prefix;
static size_t max_results = 100;
static enum ik_log_level log_level = IK_LOG_NONE;

enum class util_mode { INFO = 0, CIDRS, SUBNETS, PTR, LOOKUP, ALLOCATE, FREE };

struct mode_info
{
    util_mode mode;
    size_t min_args;
    size_t max_args;
    std::string_view usage;
};

static const std::unordered_map<std::string_view, mode_info> mode_names{
    {"info", {util_mode::INFO, 1, 1, "info <cidr>"}},
    {"cidrs", {util_mode::CIDRS, 1, 1, "cidrs <range[,range...]>"}},
    {"subnets", {util_mode::SUBNETS, 2, 2, "subnets <cidr> <prefix>"}},
    {"ptr", {util_mode::PTR, 1, 1, "ptr <address|cidr>"}},
    {"lookup", {util_mode::LOOKUP, 1, 1, "lookup <address>"}},
    {"allocate", {util_mode::ALLOCATE, 1, 2, "allocate <pool-id> [count]"}},
    {"free", {util_mode::FREE, 1, 1, "free <pool-id>"}}};

/**
 * Command-line argument handling.
 */

struct cli_option
{
    struct option opt;
    std::string_view description;
};

static struct cli_option cli_options[] = {
    {{"config", required_argument, 0, 'c'},
     "YAML address plan with pools and routes"},
    {{"log-level", required_argument, 0, 'l'},
     "log level (none, critical, error, warning, info, debug, trace)"},
    {{"json", no_argument, 0, 'j'}, "print results as JSON"},
    {{"min-prefix", required_argument, 0, 'p'},
     "smallest prefix length reported by free"},
    {{"max-results", required_argument, 0, 'n'},
     "maximum number of results listed"},
    {{"help", no_argument, 0, 'h'}, "display this help text"},
    {{0, 0, 0, 0}, ""}};

static void print_usage()
{
    std::cout << std::endl
              << "Utility to inspect and allocate IPv4 and IPv6 addresses."
              << std::endl
              << "Modes of operation:" << std::endl;

    for (const auto& [name, info] : mode_names) {
        std::cout << "    " << info.usage << std::endl;
    }

    std::cout << std::endl;

    // How much extra space to insert after the long options.
    static constexpr size_t space_fudge = 3;
    size_t max_len = 0;
    for (auto& opt : cli_options) {
        if (opt.opt.name == nullptr) break;

        max_len = std::max(max_len, strlen(opt.opt.name));
    }

    std::cout << "Usage: ipkit-util [options] <mode> <args...>" << std::endl;

    for (auto& opt : cli_options) {
        if (opt.opt.name == nullptr) break;
        std::cout << "  "
                  << "-" << static_cast<unsigned char>(opt.opt.val) << ",  "
                  << "--" << std::left << std::setw(max_len + space_fudge)
                  << opt.opt.name << " " << opt.description << std::endl;
    }
}

static std::string make_shortopts()
{
    std::string to_return;

    for (auto& opt : cli_options) {
        if (opt.opt.name != 0) {
            to_return.push_back(static_cast<char>(opt.opt.val));
            if (opt.opt.has_arg != no_argument) { to_return.append(":"); }
        }
    }

    return (to_return);
}

static unsigned long parse_number(std::string_view name, const char* arg)
{
    char* end = nullptr;
    errno = 0;
    auto value = strtoul(arg, &end, 10);
    if (errno != 0 || end == arg || *end != '\0') {
        std::cerr << "Invalid " << name << ": " << arg << std::endl;
        exit(EXIT_FAILURE);
    }
    return (value);
}

static void process_options(int argc, char* argv[])
{
    auto short_opts = make_shortopts();

    // Extract the relevant option structs so we can pass them to
    // getopt_long
    std::vector<struct option> options;
    std::transform(std::begin(cli_options),
                   std::end(cli_options),
                   std::back_inserter(options),
                   [](const struct cli_option& opt) { return opt.opt; });

    int opt_index = 0;
    while (true) {
        int opt = getopt_long(
            argc, argv, short_opts.c_str(), options.data(), &opt_index);

        if (opt == -1) { break; }

        switch (opt) {
        case 'h':
            print_usage();
            exit(EXIT_SUCCESS);
        case 'c':
            config_file = optarg;
            break;
        case 'l':
            log_level = parse_log_optarg(optarg);
            if (log_level == IK_LOG_NONE && strcasecmp(optarg, "none") != 0
                && strcmp(optarg, "0") != 0) {
                std::cerr << "Invalid log level: " << optarg << std::endl;
                exit(EXIT_FAILURE);
            }
            break;
        case 'j':
            json_output = true;
            break;
        case 'p':
            min_prefix = parse_number("minimum prefix", optarg);
            break;
        case 'n':
            max_results = parse_number("maximum results", optarg);
            break;
        default:
            print_usage();
            exit(EXIT_FAILURE);
        }
    }
}

/**
 * Load the address plan named by --config and apply its log level unless
 * one was given on the command line.
 */
static config::plan load_plan()
{
    if (config_file.empty()) {
        std::cerr << "This mode requires a --config file." << std::endl;
        exit(EXIT_FAILURE);
    }

    auto root = config::file::ik_config_load_file(config_file);
    if (!root) {
        std::cerr << root.error() << std::endl;
        exit(EXIT_FAILURE);
    }

    if (log_level == IK_LOG_NONE) {
        auto level = config::file::ik_config_get_param<std::string>(
            *root, "core.log.level");
        if (level) { ik_log_level_set(parse_log_optarg(level->c_str())); }
    }

    auto plan = config::ik_config_parse_plan(*root);
    if (!plan) {
        IK_LOG(IK_LOG_ERROR, "%s", plan.error().c_str());
        std::cerr << "Invalid configuration: " << plan.error() << std::endl;
        exit(EXIT_FAILURE);
    }

    return (std::move(*plan));
}

static const config::pool_config& find_pool(const config::plan& plan,
                                            std::string_view id)
{
    auto pool = config::ik_config_find_pool(plan, id);
    if (!pool) {
        std::cerr << "Unknown pool: " << id << std::endl;
        exit(EXIT_FAILURE);
    }
    return (*pool);
}

template <typename Container>
static void output_list(const Container& items)
{
    if (json_output) {
        std::cout << nlohmann::json(items).dump(2) << std::endl;
        return;
    }
    for (const auto& item : items) { std::cout << item << std::endl; }
}

/**
 * Mode handlers
 */

static void run_info(const std::vector<std::string>& args)
{
    auto summary = net::describe(net::parse_network(args[0]));
    if (json_output) {
        std::cout << summary.dump(2) << std::endl;
        return;
    }

    for (const auto& item : summary.items()) {
        const auto& value = item.value();
        std::cout << std::left << std::setw(16) << item.key()
                  << (value.is_string() ? value.get<std::string>()
                                        : value.dump())
                  << std::endl;
    }
}

static void run_cidrs(const std::vector<std::string>& args)
{
    output_list(net::parse_range_set(args[0]).to_cidrs());
}

static void run_subnets(const std::vector<std::string>& args)
{
    auto network = net::parse_network(args[0]);
    auto prefix = parse_number("prefix", args[1].c_str());

    auto subnets = std::vector<net::ip_network>{};
    for (auto&& subnet : network.subnets(prefix)) {
        if (subnets.size() == max_results) { break; }
        subnets.push_back(subnet);
    }

    output_list(subnets);
}

static void run_ptr(const std::vector<std::string>& args)
{
    if (args[0].find('/') != std::string::npos) {
        output_list(net::ptr_zones(net::parse_network(args[0])));
    } else {
        output_list(std::vector<std::string>{
            net::to_ptr(net::parse_address(args[0]))});
    }
}

static void run_lookup(const std::vector<std::string>& args)
{
    auto plan = load_plan();
    auto tables = config::ik_config_make_route_tables(plan.routes);
    auto addr = net::parse_address(args[0]);

    auto match = tables.lookup(addr);
    if (json_output) {
        auto j = nlohmann::json{{"address", addr}};
        if (match) {
            j["network"] = match->network;
            j["next_hop"] = match->value;
        } else {
            j["network"] = nullptr;
        }
        std::cout << j.dump(2) << std::endl;
    } else if (match) {
        std::cout << addr << " via " << match->value << " (" << match->network
                  << ")" << std::endl;
    } else {
        std::cout << addr << ": no route" << std::endl;
    }

    if (!match) { exit(EXIT_FAILURE); }
}

static void run_allocate(const std::vector<std::string>& args)
{
    auto plan = load_plan();
    auto allocator = config::ik_config_make_allocator(find_pool(plan, args[0]));
    auto count = args.size() > 1 ? parse_number("count", args[1].c_str()) : 1;

    auto allocated = std::vector<net::ip_address>{};
    while (allocated.size() < count) {
        auto next = allocator.allocate_next();
        if (!next) { break; }
        allocated.push_back(*next);
    }

    if (json_output) {
        auto j = net::describe(allocator);
        j["allocated"] = allocated;
        std::cout << j.dump(2) << std::endl;
    } else {
        output_list(allocated);
        std::cout << "Utilization: " << std::fixed << std::setprecision(2)
                  << allocator.utilization() * 100 << "%" << std::endl;
    }

    if (allocated.size() < count) {
        std::cerr << "Pool " << args[0] << " exhausted after "
                  << allocated.size() << " of " << count << " addresses"
                  << std::endl;
        exit(EXIT_FAILURE);
    }
}

static void run_free(const std::vector<std::string>& args)
{
    auto plan = load_plan();
    auto allocator = config::ik_config_make_allocator(find_pool(plan, args[0]));

    output_list(allocator.free_blocks(min_prefix, max_results));
}

int main(int argc, char* argv[])
{
    process_options(argc, argv);
    if (log_level != IK_LOG_NONE) { ik_log_level_set(log_level); }

    if (optind >= argc) {
        print_usage();
        exit(EXIT_FAILURE);
    }

    auto mode = mode_names.find(argv[optind]);
    if (mode == mode_names.end()) {
        std::cerr << "Invalid mode " << argv[optind] << "." << std::endl;
        print_usage();
        exit(EXIT_FAILURE);
    }

    auto args = std::vector<std::string>(argv + optind + 1, argv + argc);
    const auto& info = mode->second;
    if (args.size() < info.min_args || args.size() > info.max_args) {
        std::cerr << "Usage: ipkit-util " << info.usage << std::endl;
        exit(EXIT_FAILURE);
    }

    try {
        switch (info.mode) {
        case util_mode::INFO:
            run_info(args);
            break;
        case util_mode::CIDRS:
            run_cidrs(args);
            break;
        case util_mode::SUBNETS:
            run_subnets(args);
            break;
        case util_mode::PTR:
            run_ptr(args);
            break;
        case util_mode::LOOKUP:
            run_lookup(args);
            break;
        case util_mode::ALLOCATE:
            run_allocate(args);
            break;
        case util_mode::FREE:
            run_free(args);
            break;
        }
    } catch (const net::parse_error& e) {
        std::cerr << "Parse error: " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    } catch (const net::invariant_error& e) {
        std::cerr << e.what() << std::endl;
        exit(EXIT_FAILURE);
    } catch (const net::out_of_range_error& e) {
        std::cerr << e.what() << std::endl;
        exit(EXIT_FAILURE);
    } catch (const net::version_mismatch_error& e) {
        std::cerr << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    return (0);
}
