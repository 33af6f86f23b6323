#ifndef HYDRA_MODEL_BACKBONE_HPP
#define HYDRA_MODEL_BACKBONE_HPP
/*
 * Backbone
 * ---------------------------------------------------------------------------
 *  A single trainable network serving three tasks over (batch, n_in, space_dim)
 *  series: classify, featurize and forecast.
 *
 *  - Each task is unlocked by its prepare_to_* call, which validates the task
 *    size, records it and installs the matching head. Preparing twice logs a
 *    warning and overwrites the head.
 *  - forward(x, task) is the only route into the task computations. It checks
 *    the input geometry, the readiness marker and the output geometry.
 *  - The featurizer is the parameter subset shared by every task. Freezing it
 *    records each parameter's trainable flag so unfreezing restores it.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../common/hyperparameters.hpp"
#include "../common/save_load.hpp"
#include "../forecast/horizon.hpp"
#include "../layer/layer.hpp"
#include "../utils/log.hpp"
#include "readiness.hpp"

namespace Hydra::Model {
    inline constexpr const char* kClassifierHead = "classifier";
    inline constexpr const char* kForecasterHead = "forecaster";

    inline constexpr const char* kHyperparametersFile = "hyperparameters.json";
    inline constexpr const char* kParametersFile = "parameters.pt";

    // Construction values shared by every backbone.
    struct BackboneOptions {
        Dimensions dimensions{};
        TaskSizes sizes{};
        std::size_t head_layers{3};
        std::optional<torch::nn::AnyModule> classifier{};
        std::optional<torch::nn::AnyModule> forecaster{};
        // Configuration entries no backbone recognised; layer builders pick what they understand.
        Common::PropertyTree extra{};
    };

    inline BackboneOptions backbone_options_from_config(const Common::Config& config)
    {
        BackboneOptions options{};
        options.dimensions.n_in = config.require<std::int64_t>("n_in");
        options.dimensions.space_dim = config.require<std::int64_t>("space_dim");
        options.sizes.n_classes = config.find<std::int64_t>("n_classes");
        options.sizes.n_features = config.find<std::int64_t>("n_features");
        options.sizes.n_out = config.find<std::int64_t>("n_out");
        const auto head_layers = config.get<std::int64_t>("head_layers", 3);
        options.head_layers = static_cast<std::size_t>(Common::check_int_arg(head_layers, 0, "number of head layers"));
        return options;
    }

    class Backbone : public torch::nn::Module {
    public:
        using ForecastFunction = std::function<torch::Tensor(const torch::Tensor&, std::int64_t)>;
        using ForecastStrategies = std::map<std::string, ForecastFunction>;

        explicit Backbone(BackboneOptions options)
            : options_(std::move(options))
        {
            Common::check_int_arg(options_.dimensions.n_in, 1, "number of input time steps");
            Common::check_int_arg(options_.dimensions.space_dim, 1, "space dimension");
            if (!options_.sizes.any()) {
                throw ConfigurationError("One of `n_classes`, `n_features`, `n_out` must be given.");
            }

            hyperparameters_.record("n_in", options_.dimensions.n_in);
            hyperparameters_.record("space_dim", options_.dimensions.space_dim);
            hyperparameters_.record("n_classes", options_.sizes.n_classes);
            hyperparameters_.record("n_features", options_.sizes.n_features);
            hyperparameters_.record("n_out", options_.sizes.n_out);
            hyperparameters_.record("head_layers", static_cast<std::int64_t>(options_.head_layers));
        }

        ~Backbone() override = default;

        using torch::nn::Module::load;
        using torch::nn::Module::save;

        [[nodiscard]] virtual std::string name() const = 0;

        virtual void prepare_to_classify(std::int64_t n_classes,
                                         std::optional<torch::nn::AnyModule> head = std::nullopt) = 0;
        virtual void prepare_to_featurize(std::int64_t n_features) = 0;
        virtual void prepare_to_forecast(std::int64_t n_out,
                                         std::optional<torch::nn::AnyModule> head = std::nullopt) = 0;

        [[nodiscard]] bool is_prepared(Task task) const noexcept { return readiness_.prepared(task); }
        [[nodiscard]] bool is_prepared_to_classify() const noexcept { return is_prepared(Task::Classify); }
        [[nodiscard]] bool is_prepared_to_featurize() const noexcept { return is_prepared(Task::Featurize); }
        [[nodiscard]] bool is_prepared_to_forecast() const noexcept { return is_prepared(Task::Forecast); }

        [[nodiscard]] std::int64_t n_in() const noexcept { return options_.dimensions.n_in; }
        [[nodiscard]] std::int64_t space_dim() const noexcept { return options_.dimensions.space_dim; }
        [[nodiscard]] std::optional<std::int64_t> n_classes() const noexcept { return readiness_.n_classes(); }
        [[nodiscard]] std::optional<std::int64_t> n_features() const noexcept { return readiness_.n_features(); }
        [[nodiscard]] std::optional<std::int64_t> n_out() const noexcept { return readiness_.n_out(); }

        torch::Tensor forward(const torch::Tensor& input, Task task)
        {
            check_input(input);
            require_prepared_(task);

            switch (task) {
                case Task::Classify: {
                    auto logits = forward_classify(input);
                    if (logits.dim() != 2 || logits.size(1) != *readiness_.n_classes()) {
                        throw ShapeError(name() + " classifier produced " + Common::format_shape(logits)
                                         + ", expected " + std::to_string(*readiness_.n_classes()) + " columns.");
                    }
                    return logits;
                }
                case Task::Featurize: {
                    auto features = forward_featurize(input);
                    if (features.dim() != 2 || features.size(1) != *readiness_.n_features()) {
                        throw ShapeError(name() + " featurizer produced " + Common::format_shape(features)
                                         + ", expected " + std::to_string(*readiness_.n_features()) + " columns.");
                    }
                    return features;
                }
                case Task::Forecast: {
                    auto forecast = forward_forecast(input);
                    if (forecast.dim() != 3 || forecast.size(1) != *readiness_.n_out()
                        || forecast.size(2) != space_dim()) {
                        throw ShapeError(name() + " forecaster produced " + Common::format_shape(forecast)
                                         + ", expected (" + std::to_string(*readiness_.n_out()) + ", "
                                         + std::to_string(space_dim()) + ") per sample.");
                    }
                    return forecast;
                }
            }
            throw std::logic_error("Unknown task dispatched to " + name() + ".");
        }

        // Predicted class index per sample.
        torch::Tensor classify(const torch::Tensor& input)
        {
            auto logits = forward(input, Task::Classify);
            return torch::log_softmax(logits, /*dim=*/1).argmax(/*dim=*/1);
        }

        torch::Tensor featurize(const torch::Tensor& input) { return forward(input, Task::Featurize); }

        torch::Tensor forecast_in_chunks(const torch::Tensor& input, std::int64_t n)
        {
            require_prepared_(Task::Forecast);
            return Forecast::forecast_in_chunks(input, n, n_in(), *readiness_.n_out(),
                                                [this](const torch::Tensor& window) {
                                                    return forward(window, Task::Forecast);
                                                });
        }

        // Horizon extensions applicable to this backbone, by name. "chunks" is always present.
        [[nodiscard]] virtual ForecastStrategies forecast_strategies()
        {
            ForecastStrategies strategies;
            strategies.emplace("chunks", [this](const torch::Tensor& input, std::int64_t n) {
                return forecast_in_chunks(input, n);
            });
            return strategies;
        }

        torch::Tensor forecast_with(const std::string& strategy, const torch::Tensor& input, std::int64_t n)
        {
            auto strategies = forecast_strategies();
            auto found = strategies.find(strategy);
            if (found == strategies.end()) {
                std::string available;
                for (const auto& [key, function] : strategies) {
                    available += (available.empty() ? "" : ", ") + key;
                }
                throw StrategyError("Unknown forecasting strategy '" + strategy + "' for " + name()
                                    + " (available: " + available + ").");
            }
            return found->second(input, n);
        }

        [[nodiscard]] virtual std::vector<torch::Tensor> featurizer_parameters() = 0;

        void freeze_featurizer()
        {
            for (auto& parameter : featurizer_parameters()) {
                frozen_.try_emplace(parameter.unsafeGetTensorImpl(), parameter.requires_grad());
                parameter.set_requires_grad(false);
            }
        }

        // Restores the flags recorded by freeze_featurizer(). No effect when nothing is frozen.
        void unfreeze_featurizer()
        {
            for (auto& parameter : featurizer_parameters()) {
                auto found = frozen_.find(parameter.unsafeGetTensorImpl());
                if (found != frozen_.end()) {
                    parameter.set_requires_grad(found->second);
                }
            }
            frozen_.clear();
        }

        [[nodiscard]] bool featurizer_frozen() const noexcept { return !frozen_.empty(); }

        [[nodiscard]] const Common::Hyperparameters& hyperparameters() const noexcept { return hyperparameters_; }

        void save(const std::filesystem::path& directory) const
        {
            std::filesystem::create_directories(directory);
            hyperparameters_.save(directory / kHyperparametersFile);
            Common::SaveLoad::save_parameters(*this, directory / kParametersFile);
        }

        // The backbone must be configured and prepared like the one that was saved.
        void load(const std::filesystem::path& directory)
        {
            Common::SaveLoad::load_parameters(*this, directory / kParametersFile);
        }

    protected:
        virtual torch::Tensor forward_classify(const torch::Tensor& input) = 0;
        virtual torch::Tensor forward_featurize(const torch::Tensor& input) = 0;
        virtual torch::Tensor forward_forecast(const torch::Tensor& input) = 0;

        // Shared part of every prepare_to_* override: validate, mark, warn on re-preparation, record.
        void mark_prepared(Task task, std::int64_t size)
        {
            if (readiness_.mark(task, size)) {
                Utils::Log::warning("this " + name() + " is already prepared to " + to_string(task));
            }
            hyperparameters_.record(TaskReadiness::size_name(task), size);
        }

        // Runs the prepare calls requested at construction. Call once, at the end of the derived constructor.
        void prepare_requested_tasks(const std::vector<Task>& order)
        {
            for (const auto task : order) {
                switch (task) {
                    case Task::Classify:
                        if (options_.sizes.n_classes) {
                            prepare_to_classify(*options_.sizes.n_classes, options_.classifier);
                        }
                        break;
                    case Task::Featurize:
                        if (options_.sizes.n_features) {
                            prepare_to_featurize(*options_.sizes.n_features);
                        }
                        break;
                    case Task::Forecast:
                        if (options_.sizes.n_out) {
                            prepare_to_forecast(*options_.sizes.n_out, options_.forecaster);
                        }
                        break;
                }
            }
        }

        void install_head(const std::string& head_name,
                          std::optional<torch::nn::AnyModule> head,
                          std::int64_t in_features,
                          std::int64_t out_features)
        {
            auto module = head ? std::move(*head) : Layer::make_head(in_features, out_features, options_.head_layers);
            if (named_children().contains(head_name)) {
                replace_module(head_name, module.ptr());
            } else {
                register_module(head_name, module.ptr());
            }
            heads_.insert_or_assign(head_name, std::move(module));
        }

        torch::Tensor apply_head(const std::string& head_name, const torch::Tensor& input)
        {
            auto found = heads_.find(head_name);
            if (found == heads_.end()) {
                throw ReadinessError(name() + " has no " + head_name + " head.");
            }
            return found->second.forward(input);
        }

        // Unrecognised configuration entries this backbone cannot use.
        void note_ignored_extra(std::initializer_list<std::string> understood) const
        {
            for (const auto& [key, node] : options_.extra) {
                bool used = false;
                for (const auto& candidate : understood) {
                    used = used || candidate == key;
                }
                if (!used) {
                    Utils::Log::info(name() + " ignores configuration key '" + key + "'.");
                }
            }
        }

        [[nodiscard]] const BackboneOptions& backbone_options() const noexcept { return options_; }
        Common::Hyperparameters& mutable_hyperparameters() noexcept { return hyperparameters_; }

        // Every public entry point taking a window calls this before touching the input.
        void check_input(const torch::Tensor& input) const
        {
            if (input.dim() != 3) {
                throw ShapeError(name() + " expects (batch, n_in, space_dim) inputs, got "
                                 + Common::format_shape(input) + ".");
            }
            if (input.size(1) != n_in()) {
                throw ShapeError(name() + " should take " + std::to_string(n_in()) + " time steps as input (got "
                                 + std::to_string(input.size(1)) + ").");
            }
            if (input.size(2) != space_dim()) {
                throw ShapeError(name() + " should take inputs with dimension " + std::to_string(space_dim())
                                 + " (got " + std::to_string(input.size(2)) + ").");
            }
        }

    private:
        void require_prepared_(Task task) const
        {
            if (!readiness_.prepared(task)) {
                throw ReadinessError(name() + " was not prepared to " + to_string(task) + ".");
            }
        }

        BackboneOptions options_{};
        TaskReadiness readiness_{};
        Common::Hyperparameters hyperparameters_{};
        std::map<std::string, torch::nn::AnyModule> heads_{};
        std::unordered_map<const c10::TensorImpl*, bool> frozen_{};
    };
}

#endif // HYDRA_MODEL_BACKBONE_HPP
