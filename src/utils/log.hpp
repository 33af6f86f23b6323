#ifndef HYDRA_UTILS_LOG_HPP
#define HYDRA_UTILS_LOG_HPP
/*
 * Process-wide message sink.
 * ---------------------------------------------------------------------------
 *  - Messages go to an std::ostream* (std::cout unless redirected), the same
 *    convention the training/evaluation options use for their reports.
 *  - Colors are ANSI sequences from utils/terminal.hpp and can be switched off
 *    when the sink is not a terminal (files, string streams in tests).
 *  - Not synchronised: mutations of the sink follow the single-writer rule of
 *    the rest of the library.
 */

#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include "terminal.hpp"

namespace Hydra::Utils::Log {
    struct Sink {
        std::ostream* stream{&std::cout};
        bool colors{true};
    };

    namespace Detail {
        inline Sink& sink()
        {
            static Sink instance{};
            return instance;
        }

        inline void emit(std::string_view tag, std::string_view symbol, std::string_view color, std::string_view message)
        {
            auto& current = sink();
            if (current.stream == nullptr) {
                return;
            }
            auto& out = *current.stream;
            if (current.colors) {
                out << Terminal::ApplyColor(std::string(symbol) + " [Hydra] " + std::string(tag), color);
            } else {
                out << "[Hydra] " << tag;
            }
            out << ' ' << message << std::endl;
        }
    }

    // Passing nullptr silences every message.
    inline void set_stream(std::ostream* stream) { Detail::sink().stream = stream; }
    inline void set_colors(bool enabled) { Detail::sink().colors = enabled; }

    inline void info(std::string_view message)
    {
        Detail::emit("Info:", Terminal::Symbols::kInfo, Terminal::Colors::kAzure, message);
    }

    inline void warning(std::string_view message)
    {
        Detail::emit("Warning:", Terminal::Symbols::kWarn, Terminal::Colors::kOrange, message);
    }

    // Restores the previous sink on scope exit.
    class ScopedStream {
    public:
        explicit ScopedStream(std::ostream* stream, bool colors = false)
            : previous_(Detail::sink())
        {
            Detail::sink() = Sink{stream, colors};
        }

        ScopedStream(const ScopedStream&) = delete;
        ScopedStream& operator=(const ScopedStream&) = delete;

        ~ScopedStream() { Detail::sink() = previous_; }

    private:
        Sink previous_{};
    };
}

#endif // HYDRA_UTILS_LOG_HPP
