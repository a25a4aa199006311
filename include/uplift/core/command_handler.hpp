#pragma once

#include <string>
#include <vector>

namespace uplift::core {

struct CommandResult {
    bool success = true;
    int exit_code = 0;
    std::string message;

    static CommandResult ok(const std::string& message = "") {
        return {true, 0, message};
    }

    static CommandResult error(const std::string& message, int exit_code = 1) {
        return {false, exit_code, message};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class UploadCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload a file, resuming an earlier attempt if one exists"; }
    std::string get_usage() const override { return "uplift upload <file> [wifi-only|power-saving|low-priority]"; }
};

class ResumeCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Resume a paused or interrupted upload"; }
    std::string get_usage() const override { return "uplift resume <session_id>"; }
};

class CancelCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Cancel an upload and abort it on the backend"; }
    std::string get_usage() const override { return "uplift cancel <session_id>"; }
};

class StatusCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show recorded uploads, or the parts of one upload"; }
    std::string get_usage() const override { return "uplift status [session_id]"; }
};

class RecoverCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Pick up uploads left unfinished by an earlier run"; }
    std::string get_usage() const override { return "uplift recover"; }
};

class CleanupCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete finished uploads older than the retention period"; }
    std::string get_usage() const override { return "uplift cleanup [days]"; }
};

}
