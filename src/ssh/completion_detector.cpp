#include "completion_detector.hpp"
#include "prompt_detector.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

const char* to_string(CompletionReason reason) {
    switch (reason) {
        case CompletionReason::PromptSeen:    return "prompt";
        case CompletionReason::Quiescent:     return "quiescent";
        case CompletionReason::TimedOut:      return "timeout";
        case CompletionReason::ChannelFailed: return "channel-failed";
    }
    return "unknown";
}

bool output_ends_with_prompt(const std::string& text, const std::string& prompt, int count) {
    if (prompt.empty()) return false;
    std::string clean = rtrim_copy(strip_ansi(text));
    if (!ends_with(clean, prompt)) return false;
    return count <= 1 || count_occurrences(clean, prompt) >= static_cast<size_t>(count);
}

CompletionDetector::CompletionDetector(ShellSession& session, const TimingConfig& timing)
    : session_(session), timing_(timing) {
}

Completion CompletionDetector::wait(size_t start_pos, Clock::time_point sent_at,
                                    const std::optional<std::string>& prompt, int prompt_count) {
    Clock& clock = session_.clock();
    const auto quiescence = Clock::duration(timing_.quiescence_ms);
    const auto min_wait = Clock::duration(timing_.min_wait_ms);
    const auto timeout = Clock::duration(timing_.command_timeout_ms);
    const auto poll = Clock::duration(timing_.poll_interval_ms);

    size_t last_size = session_.buffer().size();
    Clock::time_point last_growth = sent_at;

    auto finish = [&](CompletionReason reason, Clock::time_point now) {
        Completion c{reason, session_.buffer().since(start_pos), "", ErrorKind::None,
                     ms_between(sent_at, now)};
        probe_log(fmt::format("completion: {} after {}ms ({} bytes)",
                              to_string(reason), c.elapsed.count(), c.output.size()));
        return c;
    };

    while (true) {
        auto pumped = session_.pump();
        auto now = clock.now();

        if (pumped.is_err()) {
            Completion c = finish(CompletionReason::ChannelFailed, now);
            c.error = pumped.error;
            c.kind = pumped.kind;
            return c;
        }

        size_t size = session_.buffer().size();
        if (size > last_size) {
            last_size = size;
            last_growth = now;
        }

        if (prompt && output_ends_with_prompt(session_.buffer().since(start_pos), *prompt, prompt_count)) {
            return finish(CompletionReason::PromptSeen, now);
        }

        if (ms_between(last_growth, now) >= quiescence && ms_between(sent_at, now) >= min_wait) {
            return finish(CompletionReason::Quiescent, now);
        }

        if (ms_between(sent_at, now) >= timeout) {
            return finish(CompletionReason::TimedOut, now);
        }

        clock.sleep_for(poll);
    }
}
