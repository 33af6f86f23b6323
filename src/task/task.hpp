#ifndef HYDRA_TASK_HPP
#define HYDRA_TASK_HPP
/*
 * Task views
 * ---------------------------------------------------------------------------
 *  Thin wrappers binding one task of a shared backbone to its training loss.
 *  Every view holds the same std::shared_ptr, so parameters, readiness and
 *  featurizer freezing are common to all of them.
 */

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../loss/loss.hpp"
#include "../model/backbone.hpp"

namespace Hydra::Task {
    using BackbonePtr = std::shared_ptr<::Hydra::Model::Backbone>;

    namespace Detail {
        inline BackbonePtr require_backbone(BackbonePtr backbone)
        {
            if (!backbone) {
                throw std::invalid_argument("Task views require a backbone.");
            }
            return backbone;
        }
    }

    class View {
    public:
        [[nodiscard]] ::Hydra::Model::Backbone& backbone() const noexcept { return *backbone_; }

        // Parameters the task trains: the whole backbone, minus whatever is frozen.
        [[nodiscard]] std::vector<torch::Tensor> trainable_parameters() const
        {
            std::vector<torch::Tensor> parameters;
            for (const auto& parameter : backbone_->parameters()) {
                if (parameter.requires_grad()) {
                    parameters.push_back(parameter);
                }
            }
            return parameters;
        }

        void freeze_featurizer() const { backbone_->freeze_featurizer(); }
        void unfreeze_featurizer() const { backbone_->unfreeze_featurizer(); }

    protected:
        explicit View(BackbonePtr backbone) : backbone_(Detail::require_backbone(std::move(backbone))) {}

        BackbonePtr backbone_;
    };

    class Classifier : public View {
    public:
        explicit Classifier(BackbonePtr backbone, ::Hydra::Loss::CrossEntropyOptions loss = {})
            : View(std::move(backbone)), loss_(::Hydra::Loss::CrossEntropy(loss))
        {
            if (!backbone_->is_prepared_to_classify()) {
                throw ReadinessError(backbone_->name() + " was not prepared to classify.");
            }
        }

        [[nodiscard]] torch::Tensor logits(const torch::Tensor& input) const
        {
            return backbone_->forward(input, ::Hydra::Model::Task::Classify);
        }

        [[nodiscard]] torch::Tensor predict(const torch::Tensor& input) const { return backbone_->classify(input); }

        // `target` holds class indices.
        [[nodiscard]] torch::Tensor loss(const torch::Tensor& input, const torch::Tensor& target) const
        {
            return ::Hydra::Loss::compute(loss_, logits(input), target);
        }

    private:
        ::Hydra::Loss::Details::CrossEntropyDescriptor loss_;
    };

    class Featurizer : public View {
    public:
        explicit Featurizer(BackbonePtr backbone, ::Hydra::Loss::TripletMarginOptions loss = {})
            : View(std::move(backbone)), loss_(::Hydra::Loss::TripletMargin(loss))
        {
            if (!backbone_->is_prepared_to_featurize()) {
                throw ReadinessError(backbone_->name() + " was not prepared to featurize.");
            }
        }

        [[nodiscard]] torch::Tensor predict(const torch::Tensor& input) const { return backbone_->featurize(input); }

        // Anchor and positive share a label, the negative does not.
        [[nodiscard]] torch::Tensor loss(const torch::Tensor& anchor,
                                         const torch::Tensor& positive,
                                         const torch::Tensor& negative) const
        {
            return ::Hydra::Loss::compute(loss_, predict(anchor), predict(positive), predict(negative));
        }

    private:
        ::Hydra::Loss::Details::TripletMarginDescriptor loss_;
    };

    class Forecaster : public View {
    public:
        explicit Forecaster(BackbonePtr backbone, ::Hydra::Loss::MSEOptions loss = {})
            : View(std::move(backbone)), loss_(::Hydra::Loss::MSE(loss))
        {
            if (!backbone_->is_prepared_to_forecast()) {
                throw ReadinessError(backbone_->name() + " was not prepared to forecast.");
            }
        }

        // Native horizon: (batch, n_out, space_dim).
        [[nodiscard]] torch::Tensor predict(const torch::Tensor& input) const
        {
            return backbone_->forward(input, ::Hydra::Model::Task::Forecast);
        }

        // Input followed by n forecast steps.
        [[nodiscard]] torch::Tensor extend(const torch::Tensor& input, std::int64_t n) const
        {
            return backbone_->forecast_in_chunks(input, n);
        }

        // `future` holds the n_out steps following `input`.
        [[nodiscard]] torch::Tensor loss(const torch::Tensor& input, const torch::Tensor& future) const
        {
            return ::Hydra::Loss::compute(loss_, predict(input), future);
        }

    private:
        ::Hydra::Loss::Details::MSEDescriptor loss_;
    };
}

#endif // HYDRA_TASK_HPP
