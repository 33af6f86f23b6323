#ifndef HYDRA_MODEL_REGISTRY_HPP
#define HYDRA_MODEL_REGISTRY_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "attention.hpp"
#include "backbone.hpp"
#include "nbeats.hpp"
#include "recurrent.hpp"

namespace Hydra::Model {
    using BackbonePtr = std::shared_ptr<Backbone>;

    namespace Detail {
        using Builder = std::function<BackbonePtr(const Common::Config&)>;

        struct Entry {
            std::string kind;
            Builder build;
        };

        inline BackbonePtr build_recurrent(const Common::Config& config, std::optional<Layer::RecurrentCell> cell)
        {
            auto options = recurrent_options_from_config(config);
            if (cell) {
                options.model = *cell;
            }
            return RecurrentBackbone(std::move(options)).ptr();
        }

        inline const std::vector<Entry>& entries()
        {
            static const std::vector<Entry> table{
                {"GRU", [](const Common::Config& config) { return build_recurrent(config, Layer::RecurrentCell::GRU); }},
                {"LSTM", [](const Common::Config& config) { return build_recurrent(config, Layer::RecurrentCell::LSTM); }},
                {"RNN", [](const Common::Config& config) { return build_recurrent(config, std::nullopt); }},
                {"Transformer", [](const Common::Config& config) -> BackbonePtr {
                    return AttentionBackbone(attention_options_from_config(config)).ptr();
                }},
                {"N-BEATS", [](const Common::Config& config) -> BackbonePtr {
                    return NBeatsBackbone(nbeats_options_from_config(config)).ptr();
                }},
            };
            return table;
        }
    }

    // "RNN" takes its cell from the `model` key; "GRU" and "LSTM" override it.
    inline BackbonePtr make_backbone(const std::string& kind, const Common::Config& config)
    {
        for (const auto& entry : Detail::entries()) {
            if (entry.kind == kind) {
                return entry.build(config);
            }
        }
        std::string known;
        for (const auto& entry : Detail::entries()) {
            known += (known.empty() ? "" : ", ") + entry.kind;
        }
        throw ConfigurationError("Unknown backbone '" + kind + "' (known: " + known + ").");
    }

    inline std::vector<std::string> registered_backbones()
    {
        std::vector<std::string> kinds;
        for (const auto& entry : Detail::entries()) {
            kinds.push_back(entry.kind);
        }
        return kinds;
    }
}

#endif // HYDRA_MODEL_REGISTRY_HPP
