#pragma once
#include "core/Logger.h"
#include "core/SessionManager.h"
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Line-oriented front end to SessionManager. One command per line in, one
// JSON object per line out:
//
//   create [owner]          get <id>            touch <id>
//   refresh <id>            remove <id>         revoke <owner>
//   cleanup                 count               size
//   stats                   owner <name>        meta <id> <k> <v>
//   auth <id>               reset               help
//   quit
//
// The meta value is the rest of the line after <k>, whitespace included.
class CommandShell {
public:
    CommandShell(std::shared_ptr<SessionManager> manager, std::shared_ptr<Logger> logger = nullptr);

    nlohmann::json execute(const std::string& line);

    // Reads until EOF, "quit", or keep_running returning false.
    // Returns the number of commands executed.
    size_t run(std::istream& in, std::ostream& out, const std::function<bool()>& keep_running = nullptr);

    bool quitRequested() const { return quit_requested_; }

private:
    nlohmann::json handleCreate(const std::vector<std::string>& args);
    nlohmann::json handleGet(const std::vector<std::string>& args);
    nlohmann::json handleTouch(const std::vector<std::string>& args);
    nlohmann::json handleRefresh(const std::vector<std::string>& args);
    nlohmann::json handleRemove(const std::vector<std::string>& args);
    nlohmann::json handleRevoke(const std::vector<std::string>& args);
    nlohmann::json handleCleanup();
    nlohmann::json handleCount();
    nlohmann::json handleSize();
    nlohmann::json handleStats();
    nlohmann::json handleOwner(const std::vector<std::string>& args);
    nlohmann::json handleMeta(const std::vector<std::string>& args, const std::string& value);
    nlohmann::json handleAuth(const std::vector<std::string>& args);
    nlohmann::json handleReset();
    nlohmann::json handleHelp() const;

    // Format check before lookup; fills `error` with an InvalidFormat reply
    bool parseId(const std::string& text, std::optional<SessionId>& id, nlohmann::json& error) const;

    static nlohmann::json okReply();
    static nlohmann::json errorReply(const SessionError& error);
    static nlohmann::json usageReply(const std::string& usage);

    std::shared_ptr<SessionManager> manager_;
    std::shared_ptr<Logger> logger_;
    bool quit_requested_ = false;
};
