#ifndef HYDRA_UTILS_TERMINAL_HPP
#define HYDRA_UTILS_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Hydra::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
        inline constexpr std::string_view kAzure        = "\033[38;5;33m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kInfo  = "ℹ";
        inline constexpr std::string_view kWarn  = "⚠";
    }

    // ---------- Small helpers ----------
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }
}

#endif // HYDRA_UTILS_TERMINAL_HPP
