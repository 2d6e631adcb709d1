#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>
#include "shell_session.hpp"

enum class PromptStrategy {
    Expected,           // supplied by the caller, not discovered
    InspectBuffer,
    ProbeNewline,
    ProbeCommand,
    Fallback,
};

const char* to_string(PromptStrategy strategy);

struct PromptDiscovery {
    std::string prompt;
    PromptStrategy strategy;
    bool literal;           // false only for the fallback pattern
};

// ── Pure helpers ────────────────────────────────────────────

// Remove ANSI/VT100 escape sequences (colour, cursor movement, OSC titles).
std::string strip_ansi(const std::string& text);

// "sw1> sw1> sw1>" -> "sw1>". A line without repetition comes back unchanged.
std::string collapse_repeated_prompt(const std::string& line);

// True if the line ends in one of # > $ : ] )
bool has_prompt_ending(const std::string& line);

// The last non-blank line of text, collapsed, if it looks like a prompt and
// is no longer than max_length.
std::optional<std::string> prompt_from_tail(const std::string& text, int max_length);

// Scan lines from the bottom for the first one containing a prompt-ending
// character and return it collapsed. Empty if none.
std::string extract_prompt(const std::string& text);

// ── Discovery ───────────────────────────────────────────────

// Works out the device prompt by trying, in order: the text already in the
// buffer, a bare newline, a harmless probe command. If all three fail the
// result is a non-literal fallback pattern and the session prompt stays
// unset so completion falls back to quiescence.
// A configured expected_prompt replaces discovery entirely and sends nothing.
class PromptDetector {
public:
    PromptDetector(ShellSession& session, const TimingConfig& timing,
                   const PromptConfig& prompt);

    PromptDiscovery discover();

private:
    ShellSession& session_;
    TimingConfig timing_;
    PromptConfig config_;

    std::optional<std::string> probe(const std::string& payload);
};
