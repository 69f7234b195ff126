#ifndef _IK_CONFIG_FILE_HPP_
#define _IK_CONFIG_FILE_HPP_

#include <optional>
#include <string>
#include <string_view>

#include "tl/expected.hpp"
#include "yaml-cpp/yaml.h"

namespace ipkit::config::file {

/*
 * Load and sanity check a YAML configuration file.
 *
 * @param[in] file_name
 *   path to the configuration file
 *
 * @return
 *  the root node of the file, or a description of why it could not be
 *  read or parsed.
 *
 * @note unknown top-level nodes are logged and ignored.
 */
tl::expected<YAML::Node, std::string>
ik_config_load_file(std::string_view file_name);

/*
 * Get configuration parameter(s) for the specified path.
 * @param[in] root
 *   root node of a loaded configuration
 * @param[in] param
 *   period-delineated path to the requested parameter node
 *
 * @return
 *  a YAML::Node object representing configuration parameters, if any.
 */
std::optional<YAML::Node> ik_config_get_param(const YAML::Node& root,
                                              std::string_view param);

/*
 * Get a specific configuration parameter.
 *
 * @note this will throw on any type conversion error. YAML::BadConversion.
 *
 * @return
 *  std::optional<> object that contains the requested value if it exists,
 *  otherwise empty.
 */
template <typename T>
std::optional<T> ik_config_get_param(const YAML::Node& root,
                                     std::string_view param)
{
    auto res = ik_config_get_param(root, param);
    if (!res) { return (std::nullopt); }

    auto node = *res;
    if (node.IsNull()) { return (std::nullopt); }

    /* This can throw a YAML::BadConversion exception. */
    return (std::make_optional(node.as<T>()));
}

} // namespace ipkit::config::file

#endif /* _IK_CONFIG_FILE_HPP_ */
