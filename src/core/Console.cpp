// src/core/Console.cpp
#include "tickspec/core/Console.hpp"

namespace tickspec::core {

namespace {

const char* Escape(Tone tone) noexcept
{
    switch (tone)
    {
    case Tone::Red:   return "\x1B[31m";
    case Tone::Green: return "\x1B[32m";
    case Tone::Blue:  return "\x1B[34m";
    default:          return "";
    }
}

constexpr const char* kReset = "\x1B[0m";

} // namespace

void Console::Print(Tone tone, std::string_view text)
{
    const bool styled = m_color && tone != Tone::Plain;
    if (styled) m_out << Escape(tone);
    m_out << text;
    if (styled) m_out << kReset;
    m_out.flush();
}

void Console::PrintLine(Tone tone, std::string_view text)
{
    const bool styled = m_color && tone != Tone::Plain;
    if (styled) m_out << Escape(tone);
    m_out << text;
    if (styled) m_out << kReset;
    m_out << '\n';
    m_out.flush();
}

} // namespace tickspec::core
