#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <numeric>
#include <unistd.h>
#include <vector>

#include "config/ik_config_file.hpp"
#include "core/ik_log.h"

namespace ipkit::config::file {

constexpr static std::string_view path_delimiter(".");

using path_iterator = std::vector<std::string>::iterator;

static std::vector<std::string> split_string(std::string_view input,
                                             std::string_view delimiters)
{
    std::vector<std::string> output;
    size_t beg = 0, pos = 0;
    while ((beg = input.find_first_not_of(delimiters, pos))
           != std::string::npos) {
        pos = input.find_first_of(delimiters, beg + 1);

        output.emplace_back(input.substr(beg, pos - beg));
    }
    return (output);
}

static std::optional<YAML::Node> get_param_by_path(
    const YAML::Node& parent_node, path_iterator pos, const path_iterator end)
{
    if (pos == end) { return (parent_node); }

    if (!parent_node.IsMap()) { return (std::nullopt); }

    if (parent_node[*pos]) {
        const YAML::Node child_node = parent_node[*pos];
        return (get_param_by_path(child_node, ++pos, end));
    }

    return (std::nullopt);
}

std::optional<YAML::Node> ik_config_get_param(const YAML::Node& root,
                                              std::string_view path)
{
    auto path_components = split_string(path, path_delimiter);

    return (get_param_by_path(
        root, path_components.begin(), path_components.end()));
}

tl::expected<YAML::Node, std::string>
ik_config_load_file(std::string_view file_name)
{
    auto name = std::string(file_name);

    // Make sure the file exists and is readable.
    if (access(name.c_str(), R_OK) == -1) {
        return (tl::make_unexpected("Error (" + std::string(strerror(errno))
                                    + ") while attempting to access config "
                                      "file: "
                                    + name));
    }

    // yaml-cpp throws exceptions when the parser runs into invalid YAML.
    YAML::Node root_node;
    try {
        root_node = YAML::LoadFile(name);
    } catch (const YAML::Exception& e) {
        return (tl::make_unexpected("Error parsing configuration file "
                                    + name + ": " + e.what()));
    }

    IK_LOG(IK_LOG_DEBUG, "Reading from configuration file %s", name.c_str());

    if (!root_node.IsMap()) {
        if (root_node.IsNull()) { return (root_node); }
        return (tl::make_unexpected("Configuration file " + name
                                    + " must contain a map at the top level"));
    }

    static constexpr auto top_level_nodes =
        std::array<std::string_view, 3>{"core", "pools", "routes"};

    // YAML::Node only allows retrieving the key from an iterator, so
    // collect unknown keys by hand.
    std::vector<std::string> unknown_nodes;
    for (const auto& node : root_node) {
        auto key = node.first.as<std::string>();
        if (auto found = std::find(
                std::begin(top_level_nodes), std::end(top_level_nodes), key);
            found == std::end(top_level_nodes)) {
            unknown_nodes.push_back(std::move(key));
        }
    }

    if (!unknown_nodes.empty()) {
        IK_LOG(IK_LOG_WARNING,
               "Ignoring %zu unrecognized top-level node%s in %s: %s",
               unknown_nodes.size(),
               unknown_nodes.size() == 1 ? "" : "s",
               name.c_str(),
               std::accumulate(std::next(std::begin(unknown_nodes)),
                               std::end(unknown_nodes),
                               "\"" + unknown_nodes.front() + "\"",
                               [](const std::string& a, const std::string& b) {
                                   return (a + ", \"" + b + "\"");
                               })
                   .c_str());
    }

    return (root_node);
}

} // namespace ipkit::config::file
