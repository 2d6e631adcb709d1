#include "fingerprinter.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/command_runner.hpp>
#include <ssh/prompt_detector.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <deque>

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

Fingerprinter::Fingerprinter(ShellSession& session, const ProbeConfig& config)
    : session_(session), config_(config), extractor_(config.extraction) {
}

void Fingerprinter::report(const std::string& msg) {
    probe_log("fingerprint: " + msg);
    if (on_status_) on_status_(msg);
}

Result<CommandResult> Fingerprinter::execute(const std::string& cmd) {
    CommandResult r = runner_->run(cmd);
    probe_log_command("fingerprint", cmd, r);
    executed_.push_back(cmd);
    if (r.failed() && session_.state() != ConnectionState::ShellActive) {
        return Result<CommandResult>::Err(
            fmt::format("Connection lost running '{}': {}", cmd, r.error), r.kind);
    }
    return Result<CommandResult>::Ok(r);
}

Result<void> Fingerprinter::disable_paging(DeviceRecord& record) {
    const std::string& paging = device_profile(record.type).paging_command;
    if (paging.empty() || !record.paging_command.empty()) return Result<void>::Ok();

    report("Disabling paging: " + paging);
    auto r = execute(paging);
    if (r.is_err()) return Result<void>::Err(r.error, r.kind);
    if (!r.value.failed()) record.paging_command = paging;
    return Result<void>::Ok();
}

Result<void> Fingerprinter::identify(DeviceRecord& record,
                                     const std::vector<std::string>& extra_commands) {
    auto settled = session_.settle(config_.timing.shell_settle_ms, config_.timing.poll_interval_ms);
    if (settled.is_err()) {
        return Result<void>::Err("Shell closed during login: " + settled.error, settled.kind);
    }

    report("Detecting prompt");
    PromptDetector detector(session_, config_.timing, config_.prompt);
    PromptDiscovery discovery = detector.discover();
    record.detected_prompt = discovery.prompt;
    report(fmt::format("Prompt: '{}' ({})", discovery.prompt, to_string(discovery.strategy)));

    // Banner/MOTD often names the OS already
    record.type = classifier_.classify(session_.buffer().snapshot());
    if (record.type != DeviceType::Unknown) {
        report(fmt::format("Device type from banner: {}", to_string(record.type)));
        auto paged = disable_paging(record);
        if (paged.is_err()) return paged;
    }

    const auto& initial = device_profile(record.type).identification_commands;
    std::deque<std::string> queue(initial.begin(), initial.end());

    while (!queue.empty()) {
        std::string cmd = queue.front();
        queue.pop_front();
        if (contains(executed_, cmd)) continue;

        report("Running: " + cmd);
        auto r = execute(cmd);
        if (r.is_err()) return Result<void>::Err(r.error, r.kind);
        record.command_outputs[cmd] = r.value.output;

        if (record.type != DeviceType::Unknown) continue;

        DeviceType t = classifier_.classify(session_.buffer().snapshot());
        if (t == DeviceType::Unknown) continue;

        record.type = t;
        report(fmt::format("Device type: {} (after '{}')", to_string(t), cmd));
        auto paged = disable_paging(record);
        if (paged.is_err()) return paged;

        // Remaining commands come from the newly known type
        queue.clear();
        for (const auto& next : device_profile(t).identification_commands) {
            if (!contains(executed_, next)) queue.push_back(next);
        }
    }

    for (const auto& cmd : extra_commands) {
        report("Running: " + cmd);
        auto r = execute(cmd);
        if (r.is_err()) return Result<void>::Err(r.error, r.kind);
        record.command_outputs[cmd] = r.value.output;
    }

    // No prompt was found up front; the command outputs may show one now
    if (discovery.strategy == PromptStrategy::Fallback) {
        std::string seen = extract_prompt(session_.buffer().snapshot());
        if (!seen.empty() && static_cast<int>(seen.size()) <= config_.prompt.max_length) {
            record.detected_prompt = seen;
            report("Prompt from command output: '" + seen + "'");
        }
    }

    report("Extracting device details");
    extractor_.extract(session_.buffer().snapshot(), record);
    return Result<void>::Ok();
}

DeviceRecord Fingerprinter::run(const ProbeTarget& target,
                                const std::vector<std::string>& extra_commands,
                                StatusCallback on_status) {
    on_status_ = std::move(on_status);
    executed_.clear();

    DeviceRecord record;
    record.host = target.host;
    record.port = target.port;
    record.username = target.user;

    report(fmt::format("Connecting to {}:{}", target.host, target.port));
    ConnectOptions opts{target.host, target.port, target.user, target.password,
                        config_.timing.connect_timeout_secs};
    auto connected = session_.connect(opts);

    if (connected.is_err()) {
        record.mark_failed(connected.error);
    } else {
        runner_ = std::make_unique<CommandRunner>(session_, config_.timing, config_.retry);
        try {
            auto r = identify(record, extra_commands);
            if (r.is_err()) {
                probe_log(fmt::format("fingerprint: fatal [{}]: {}", to_string(r.kind), r.error));
                record.mark_failed(r.error);
            } else {
                record.success = record.type != DeviceType::Unknown && !record.detected_prompt.empty();
            }
        } catch (const std::exception& e) {
            probe_log(std::string("fingerprint: unexpected error: ") + e.what());
            record.mark_failed(e.what());
        }
        runner_.reset();
    }

    record.fingerprint_time = now_iso();
    session_.disconnect();
    report(fmt::format("Finished: {} ({})", to_string(record.type),
                       record.success ? "success" : "failed"));
    return record;
}
