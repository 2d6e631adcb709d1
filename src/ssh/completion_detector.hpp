#pragma once

#include <optional>
#include <string>
#include <core/clock.hpp>
#include <core/types.hpp>
#include "shell_session.hpp"

enum class CompletionReason {
    PromptSeen,     // output since send ends with the known prompt
    Quiescent,      // no growth for the quiescence window, min wait passed
    TimedOut,       // hard deadline hit; output is partial
    ChannelFailed,  // transport error while waiting
};

const char* to_string(CompletionReason reason);

struct Completion {
    CompletionReason reason;
    std::string output;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    Clock::duration elapsed{0};
};

// Decides when the output of one command has finished arriving. Devices
// never say "done", so this is a prompt match or a timing heuristic.
class CompletionDetector {
public:
    CompletionDetector(ShellSession& session, const TimingConfig& timing);

    // start_pos: buffer size when the command was sent.
    // sent_at:   clock reading at send time; all windows are measured from it.
    // prompt:    literal prompt, or nullopt to rely on quiescence alone.
    // prompt_count: the output must end with the prompt and hold at least
    //               this many copies of it.
    Completion wait(size_t start_pos, Clock::time_point sent_at,
                    const std::optional<std::string>& prompt, int prompt_count = 1);

private:
    ShellSession& session_;
    TimingConfig timing_;
};

// True if text, right-trimmed and with escape sequences removed, ends with
// prompt and contains it at least count times.
bool output_ends_with_prompt(const std::string& text, const std::string& prompt, int count = 1);
