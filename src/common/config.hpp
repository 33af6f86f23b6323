#ifndef HYDRA_COMMON_CONFIG_HPP
#define HYDRA_COMMON_CONFIG_HPP
/*
 * Construction dictionary shared by every backbone.
 * ---------------------------------------------------------------------------
 *  - Backed by a Boost property tree so the same document can come from a JSON
 *    file, a JSON string, or be assembled in code with set().
 *  - Getters record which top-level keys were read; whatever a backbone does
 *    not recognise is handed on through unconsumed() to the layer builders.
 *  - Malformed values surface as ConfigurationError, never as ptree errors.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "error.hpp"

namespace Hydra::Common {
    using PropertyTree = boost::property_tree::ptree;

    class Config {
    public:
        Config() = default;
        explicit Config(PropertyTree tree) : tree_(std::move(tree)) {}

        static Config from_json_string(const std::string& json)
        {
            std::istringstream stream(json);
            PropertyTree tree;
            try {
                boost::property_tree::read_json(stream, tree);
            } catch (const boost::property_tree::json_parser_error& error) {
                throw ConfigurationError(std::string("Invalid JSON configuration: ") + error.what());
            }
            return Config(std::move(tree));
        }

        static Config from_json_file(const std::filesystem::path& path)
        {
            if (!std::filesystem::exists(path)) {
                throw ConfigurationError("Configuration file not found at '" + path.string() + "'.");
            }
            PropertyTree tree;
            try {
                boost::property_tree::read_json(path.string(), tree);
            } catch (const boost::property_tree::json_parser_error& error) {
                throw ConfigurationError("Invalid JSON configuration in '" + path.string() + "': " + error.what());
            }
            return Config(std::move(tree));
        }

        template <class T>
        Config& set(const std::string& key, const T& value)
        {
            tree_.put(key, value);
            return *this;
        }

        Config& set_list(const std::string& key, const std::vector<std::int64_t>& values)
        {
            PropertyTree list;
            for (const auto value : values) {
                PropertyTree item;
                item.put_value(value);
                list.push_back({"", item});
            }
            tree_.put_child(key, list);
            return *this;
        }

        [[nodiscard]] bool contains(const std::string& key) const
        {
            auto node = tree_.get_child_optional(key);
            return node && !is_null(*node);
        }

        // Absent keys and JSON nulls both read as std::nullopt.
        template <class T>
        [[nodiscard]] std::optional<T> find(const std::string& key) const
        {
            consumed_.insert(key);
            auto node = tree_.get_child_optional(key);
            if (!node || is_null(*node)) {
                return std::nullopt;
            }
            try {
                return node->get_value<T>();
            } catch (const boost::property_tree::ptree_bad_data&) {
                throw ConfigurationError("Configuration key '" + key + "' has malformed value '"
                                         + node->data() + "'.");
            }
        }

        template <class T>
        [[nodiscard]] T get(const std::string& key, const T& fallback) const
        {
            auto value = find<T>(key);
            return value ? *value : fallback;
        }

        template <class T>
        [[nodiscard]] T require(const std::string& key) const
        {
            auto value = find<T>(key);
            if (!value) {
                throw ConfigurationError("Configuration key '" + key + "' is required.");
            }
            return *value;
        }

        // Accepts a scalar (broadcast `count` times) or a JSON array of exactly `count` integers.
        [[nodiscard]] std::vector<std::int64_t> get_list(const std::string& key,
                                                         std::size_t count,
                                                         std::int64_t fallback) const
        {
            consumed_.insert(key);
            auto node = tree_.get_child_optional(key);
            if (!node || is_null(*node)) {
                return std::vector<std::int64_t>(count, fallback);
            }
            if (node->empty()) {
                return std::vector<std::int64_t>(count, require<std::int64_t>(key));
            }

            std::vector<std::int64_t> values;
            values.reserve(node->size());
            for (const auto& item : *node) {
                try {
                    values.push_back(item.second.get_value<std::int64_t>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    throw ConfigurationError("Configuration list '" + key + "' has a non-integer entry '"
                                             + item.second.data() + "'.");
                }
            }
            if (values.size() != count) {
                throw ConfigurationError("Configuration list '" + key + "' must hold " + std::to_string(count)
                                         + " entries (got " + std::to_string(values.size()) + ").");
            }
            return values;
        }

        // Top-level entries no getter has asked for.
        [[nodiscard]] PropertyTree unconsumed() const
        {
            PropertyTree rest;
            for (const auto& [key, node] : tree_) {
                if (consumed_.count(key) == 0) {
                    rest.push_back({key, node});
                }
            }
            return rest;
        }

        [[nodiscard]] const PropertyTree& tree() const noexcept { return tree_; }

    private:
        static bool is_null(const PropertyTree& node)
        {
            return node.empty() && node.data() == "null";
        }

        PropertyTree tree_{};
        mutable std::set<std::string> consumed_{};
    };
}

#endif // HYDRA_COMMON_CONFIG_HPP
