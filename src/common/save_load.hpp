#ifndef HYDRA_COMMON_SAVE_LOAD_HPP
#define HYDRA_COMMON_SAVE_LOAD_HPP

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <torch/torch.h>

#include "error.hpp"

namespace Hydra::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }

    inline void save_parameters(const torch::nn::Module& module, const std::filesystem::path& path)
    {
        torch::serialize::OutputArchive archive;
        module.save(archive);
        try {
            archive.save_to(path.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to write parameter archive '" + path.string() + "': " + error.what());
        }
    }

    // Module::save nests one archive per child module, so "a.b.weight" lives in archive "a", then "b".
    inline torch::Tensor read_nested_tensor(torch::serialize::InputArchive& archive, const std::string& key)
    {
        const auto dot = key.find('.');
        if (dot == std::string::npos) {
            torch::Tensor tensor;
            archive.read(key, tensor);
            return tensor;
        }
        torch::serialize::InputArchive child;
        archive.read(key.substr(0, dot), child);
        return read_nested_tensor(child, key.substr(dot + 1));
    }

    // Every parameter of `module` must be present in the archive with the same shape.
    // Trainable flags are left as they were before the load.
    inline void load_parameters(torch::nn::Module& module, const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Parameter archive not found at '" + path.string() + "'.");
        }

        torch::serialize::InputArchive validation_archive;
        try {
            validation_archive.load_from(path.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to open parameter archive '" + path.string() + "': " + error.what());
        }

        auto parameters = module.named_parameters(/*recurse=*/true);
        for (const auto& item : parameters) {
            torch::Tensor stored;
            try {
                stored = read_nested_tensor(validation_archive, item.key());
            } catch (const c10::Error& error) {
                throw std::runtime_error("Checkpoint is missing parameter '" + item.key() + "': " + error.what());
            }
            if (!stored.defined()) {
                throw std::runtime_error("Checkpoint parameter '" + item.key() + "' is undefined.");
            }
            if (stored.sizes() != item.value().sizes()) {
                throw std::runtime_error("Parameter '" + item.key() + "' shape mismatch: expected "
                                         + format_shape(item.value()) + " but found "
                                         + format_shape(stored) + ".");
            }
        }

        std::vector<bool> trainable;
        trainable.reserve(parameters.size());
        for (const auto& item : parameters) {
            trainable.push_back(item.value().requires_grad());
        }

        torch::serialize::InputArchive archive;
        try {
            archive.load_from(path.string());
            module.load(archive);
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to load parameters from '" + path.string() + "': " + error.what());
        }

        auto reloaded = module.named_parameters(/*recurse=*/true);
        std::size_t index = 0;
        for (auto& item : reloaded) {
            if (index < trainable.size()) {
                item.value().set_requires_grad(trainable[index]);
            }
            ++index;
        }
    }
}

#endif // HYDRA_COMMON_SAVE_LOAD_HPP
