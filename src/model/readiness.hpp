#ifndef HYDRA_MODEL_READINESS_HPP
#define HYDRA_MODEL_READINESS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "../common/error.hpp"

namespace Hydra::Model {
    enum class Task {
        Classify,
        Featurize,
        Forecast,
    };

    inline std::string to_string(Task task)
    {
        switch (task) {
            case Task::Classify: return "classify";
            case Task::Featurize: return "featurize";
            case Task::Forecast: return "forecast";
        }
        return "unknown";
    }

    // Input geometry, fixed for the lifetime of a backbone.
    struct Dimensions {
        std::int64_t n_in{};
        std::int64_t space_dim{};
    };

    // Sizes requested at construction. At least one must be present.
    struct TaskSizes {
        std::optional<std::int64_t> n_classes{};
        std::optional<std::int64_t> n_features{};
        std::optional<std::int64_t> n_out{};

        [[nodiscard]] bool any() const noexcept
        {
            return n_classes.has_value() || n_features.has_value() || n_out.has_value();
        }
    };

    inline constexpr std::int64_t kMinClasses = 2;
    inline constexpr std::int64_t kMinFeatures = 1;
    inline constexpr std::int64_t kMinOut = 1;

    // One marker per task. A marker is only set by the matching prepare call and never cleared.
    class TaskReadiness {
    public:
        [[nodiscard]] bool prepared(Task task) const noexcept { return size(task).has_value(); }

        [[nodiscard]] const std::optional<std::int64_t>& size(Task task) const noexcept
        {
            switch (task) {
                case Task::Classify: return n_classes_;
                case Task::Featurize: return n_features_;
                case Task::Forecast: return n_out_;
            }
            return n_out_;
        }

        // Returns true when the task had already been prepared.
        bool mark(Task task, std::int64_t value)
        {
            ::Hydra::Common::check_int_arg(value, minimum(task), size_name(task));
            auto& slot = slot_(task);
            const bool was_prepared = slot.has_value();
            slot = value;
            return was_prepared;
        }

        [[nodiscard]] std::optional<std::int64_t> n_classes() const noexcept { return n_classes_; }
        [[nodiscard]] std::optional<std::int64_t> n_features() const noexcept { return n_features_; }
        [[nodiscard]] std::optional<std::int64_t> n_out() const noexcept { return n_out_; }

        [[nodiscard]] static constexpr std::int64_t minimum(Task task) noexcept
        {
            switch (task) {
                case Task::Classify: return kMinClasses;
                case Task::Featurize: return kMinFeatures;
                case Task::Forecast: return kMinOut;
            }
            return 1;
        }

        [[nodiscard]] static std::string size_name(Task task)
        {
            switch (task) {
                case Task::Classify: return "n_classes";
                case Task::Featurize: return "n_features";
                case Task::Forecast: return "n_out";
            }
            return "size";
        }

    private:
        std::optional<std::int64_t>& slot_(Task task) noexcept
        {
            switch (task) {
                case Task::Classify: return n_classes_;
                case Task::Featurize: return n_features_;
                case Task::Forecast: return n_out_;
            }
            return n_out_;
        }

        std::optional<std::int64_t> n_classes_{};
        std::optional<std::int64_t> n_features_{};
        std::optional<std::int64_t> n_out_{};
    };
}

#endif // HYDRA_MODEL_READINESS_HPP
