// include/tickspec/core/Console.hpp
#pragma once
#include <ostream>
#include <string_view>

namespace tickspec::core {

enum class Tone { Plain, Red, Green, Blue };

// ANSI-coloured terminal output for the pass/fail tally. Every write is
// flushed so progress markers show up while frames are still running.
class Console {
public:
    Console(std::ostream& out, bool color) noexcept : m_out(out), m_color(color) {}

    void Print(Tone tone, std::string_view text);
    void PrintLine(Tone tone, std::string_view text);

    bool ColorEnabled() const noexcept { return m_color; }

private:
    std::ostream& m_out;
    bool          m_color;
};

} // namespace tickspec::core
