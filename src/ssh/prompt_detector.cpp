#include "prompt_detector.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>
#include <sstream>
#include <vector>

const char* to_string(PromptStrategy strategy) {
    switch (strategy) {
        case PromptStrategy::Expected:      return "expected";
        case PromptStrategy::InspectBuffer: return "inspect-buffer";
        case PromptStrategy::ProbeNewline:  return "probe-newline";
        case PromptStrategy::ProbeCommand:  return "probe-command";
        case PromptStrategy::Fallback:      return "fallback";
    }
    return "unknown";
}

std::string strip_ansi(const std::string& text) {
    static const std::regex ansi_re(
        "\x1B\\[[0-?]*[ -/]*[@-~]"       // CSI
        "|\x1B\\][^\x07\x1B]*(\x07|\x1B\\\\)"  // OSC
        "|\x1B[@-Z\\\\-_]");            // two-byte
    return std::regex_replace(text, ansi_re, "");
}

// Non-blank lines, each trimmed, in order
static std::vector<std::string> non_blank_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        // Bare \r splits lines too (carriage-return redraws)
        size_t start = 0;
        while (start <= line.size()) {
            size_t cr = line.find('\r', start);
            std::string part = line.substr(start, cr == std::string::npos ? std::string::npos : cr - start);
            trim(part);
            if (!part.empty()) lines.push_back(part);
            if (cr == std::string::npos) break;
            start = cr + 1;
        }
    }
    return lines;
}

bool has_prompt_ending(const std::string& line) {
    if (line.empty()) return false;
    return std::string(PROMPT_ENDINGS).find(line.back()) != std::string::npos;
}

std::string collapse_repeated_prompt(const std::string& line) {
    for (char end : std::string(PROMPT_ENDINGS)) {
        if (line.find(end) == std::string::npos) continue;

        std::vector<std::string> segments;
        std::string segment;
        std::istringstream iss(line);
        while (std::getline(iss, segment, end)) {
            trim(segment);
            if (!segment.empty()) segments.push_back(segment);
        }

        if (segments.size() < 2) continue;
        bool identical = true;
        for (const auto& s : segments) {
            if (s != segments.front()) { identical = false; break; }
        }
        if (identical) {
            return segments.front() + end;
        }
    }
    return line;
}

std::optional<std::string> prompt_from_tail(const std::string& text, int max_length) {
    auto lines = non_blank_lines(strip_ansi(text));
    if (lines.empty()) return std::nullopt;

    const std::string& last = lines.back();
    if (!has_prompt_ending(last)) return std::nullopt;

    std::string candidate = collapse_repeated_prompt(last);
    if (static_cast<int>(candidate.size()) > max_length) {
        probe_log(fmt::format("prompt: candidate too long ({} chars), treating as output",
                              candidate.size()));
        return std::nullopt;
    }
    return candidate;
}

std::string extract_prompt(const std::string& text) {
    auto lines = non_blank_lines(strip_ansi(text));
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->find_first_of(PROMPT_ENDINGS) != std::string::npos) {
            return collapse_repeated_prompt(*it);
        }
    }
    return "";
}

// ── PromptDetector ──────────────────────────────────────────

PromptDetector::PromptDetector(ShellSession& session, const TimingConfig& timing,
                               const PromptConfig& prompt)
    : session_(session), timing_(timing), config_(prompt) {
}

std::optional<std::string> PromptDetector::probe(const std::string& payload) {
    size_t mark = session_.buffer().size();

    auto sent = session_.send(payload);
    if (sent.is_err()) {
        probe_log("prompt: probe send failed: " + sent.error);
        return std::nullopt;
    }

    auto settled = session_.settle(timing_.prompt_settle_ms, timing_.poll_interval_ms);
    if (settled.is_err()) {
        probe_log("prompt: lost shell while probing: " + settled.error);
    }

    std::string fresh = session_.buffer().since(mark);
    if (fresh.empty()) {
        probe_log("prompt: no new output after probe");
        return std::nullopt;
    }
    return prompt_from_tail(fresh, config_.max_length);
}

PromptDiscovery PromptDetector::discover() {
    if (!config_.expected_prompt.empty()) {
        session_.set_prompt(config_.expected_prompt, config_.expected_prompt_count);
        probe_log(fmt::format("prompt: expecting '{}' x{}", config_.expected_prompt,
                              session_.prompt_count()));
        return PromptDiscovery{config_.expected_prompt, PromptStrategy::Expected, true};
    }

    auto pumped = session_.pump();
    if (pumped.is_err()) {
        probe_log("prompt: pump failed: " + pumped.error);
    }

    auto found = [this](const std::string& p, PromptStrategy s) {
        session_.set_prompt(p);
        probe_log(fmt::format("prompt: '{}' via {}", p, to_string(s)));
        return PromptDiscovery{p, s, true};
    };

    if (auto p = prompt_from_tail(session_.buffer().snapshot(), config_.max_length)) {
        return found(*p, PromptStrategy::InspectBuffer);
    }

    if (auto p = probe("\n")) {
        return found(*p, PromptStrategy::ProbeNewline);
    }

    if (!config_.probe_command.empty()) {
        if (auto p = probe(config_.probe_command + "\n")) {
            return found(*p, PromptStrategy::ProbeCommand);
        }
    }

    probe_log(fmt::format("prompt: not detected, using fallback pattern {}", FALLBACK_PROMPT_PATTERN));
    session_.clear_prompt();
    return PromptDiscovery{FALLBACK_PROMPT_PATTERN, PromptStrategy::Fallback, false};
}
