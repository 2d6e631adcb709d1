#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/command_runner.hpp>
#include <ssh/shell_session.hpp>
#include "classifier.hpp"
#include "device_record.hpp"
#include "extractor.hpp"

// Drives one identification run over a session:
// connect, settle, find the prompt, classify, disable paging, run the
// identification commands (re-chosen as soon as the type is known), run any
// extra commands, extract fields, disconnect.
//
// Never throws. Failure shows up as record.success == false with type
// Unknown and record.error set.
class Fingerprinter {
public:
    Fingerprinter(ShellSession& session, const ProbeConfig& config);

    DeviceRecord run(const ProbeTarget& target,
                     const std::vector<std::string>& extra_commands = {},
                     StatusCallback on_status = nullptr);

private:
    ShellSession& session_;
    ProbeConfig config_;
    DeviceClassifier classifier_;
    FieldExtractor extractor_;

    // Per-run state
    std::unique_ptr<CommandRunner> runner_;
    std::vector<std::string> executed_;
    StatusCallback on_status_;

    Result<void> identify(DeviceRecord& record, const std::vector<std::string>& extra_commands);
    Result<void> disable_paging(DeviceRecord& record);

    // Err only when the shell is gone for good
    Result<CommandResult> execute(const std::string& cmd);
    void report(const std::string& msg);
};
