#ifndef HYDRA_COMMON_HYPERPARAMETERS_HPP
#define HYDRA_COMMON_HYPERPARAMETERS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "save_load.hpp"

namespace Hydra::Common {
    // Append-only record of the values a model was built and prepared with. Reporting only:
    // nothing in the forward computations reads it back.
    class Hyperparameters {
    public:
        using PropertyTree = boost::property_tree::ptree;

        template <class T>
        Hyperparameters& record(const std::string& name, const T& value)
        {
            if constexpr (std::is_same_v<std::decay_t<T>, const char*> || std::is_array_v<T>) {
                tree_.put(name, std::string(value));
            } else {
                tree_.put(name, value);
            }
            return *this;
        }

        template <class T>
        Hyperparameters& record(const std::string& name, const std::optional<T>& value)
        {
            if (value) {
                return record(name, *value);
            }
            tree_.put(name, "null");
            return *this;
        }

        // Copies every entry of `extra` under its own key, subtrees included.
        Hyperparameters& record_all(const PropertyTree& extra)
        {
            for (const auto& [key, node] : extra) {
                tree_.put_child(key, node);
            }
            return *this;
        }

        [[nodiscard]] bool contains(const std::string& name) const
        {
            return static_cast<bool>(tree_.get_child_optional(name));
        }

        template <class T>
        [[nodiscard]] std::optional<T> get(const std::string& name) const
        {
            auto value = tree_.get_optional<T>(name);
            if (!value) {
                return std::nullopt;
            }
            return *value;
        }

        [[nodiscard]] std::size_t size() const noexcept { return tree_.size(); }
        [[nodiscard]] const PropertyTree& tree() const noexcept { return tree_; }

        [[nodiscard]] std::string to_json(bool pretty = true) const
        {
            std::ostringstream stream;
            boost::property_tree::write_json(stream, tree_, pretty);
            return stream.str();
        }

        void save(const std::filesystem::path& path) const
        {
            SaveLoad::write_json_file(path, tree_);
        }

    private:
        PropertyTree tree_{};
    };
}

#endif // HYDRA_COMMON_HYPERPARAMETERS_HPP
