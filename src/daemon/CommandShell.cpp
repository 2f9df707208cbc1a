#include "daemon/CommandShell.h"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// Raw remainder of `line` after its first `count` tokens and the
// whitespace that follows them; inner whitespace is kept as typed
std::string remainderAfter(const std::string& line, size_t count) {
    const char* ws = " \t\r\n\v\f";
    size_t pos = 0;
    for (size_t i = 0; i < count && pos != std::string::npos; ++i) {
        pos = line.find_first_not_of(ws, pos);
        if (pos != std::string::npos) {
            pos = line.find_first_of(ws, pos);
        }
    }
    if (pos == std::string::npos) {
        return "";
    }
    pos = line.find_first_not_of(ws, pos);
    return pos == std::string::npos ? "" : line.substr(pos);
}

} // namespace

CommandShell::CommandShell(std::shared_ptr<SessionManager> manager, std::shared_ptr<Logger> logger)
    : manager_(std::move(manager)), logger_(std::move(logger)) {
    if (!manager_) {
        throw std::invalid_argument("CommandShell requires a session manager");
    }
}

nlohmann::json CommandShell::execute(const std::string& line) {
    std::vector<std::string> tokens = tokenize(line);
    if (tokens.empty()) {
        return usageReply("help");
    }
    const std::string command = tokens.front();
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    if (command == "create")  return handleCreate(args);
    if (command == "get")     return handleGet(args);
    if (command == "touch")   return handleTouch(args);
    if (command == "refresh") return handleRefresh(args);
    if (command == "remove")  return handleRemove(args);
    if (command == "revoke")  return handleRevoke(args);
    if (command == "cleanup") return handleCleanup();
    if (command == "count")   return handleCount();
    if (command == "size")    return handleSize();
    if (command == "stats")   return handleStats();
    if (command == "owner")   return handleOwner(args);
    if (command == "meta")    return handleMeta(args, remainderAfter(line, 3));
    if (command == "auth")    return handleAuth(args);
    if (command == "reset")   return handleReset();
    if (command == "help")    return handleHelp();
    if (command == "quit" || command == "exit") {
        quit_requested_ = true;
        nlohmann::json j = okReply();
        j["bye"] = true;
        return j;
    }

    if (logger_) {
        logger_->warn("Unknown command: " + command);
    }
    nlohmann::json j;
    j["ok"] = false;
    j["error"] = "unknown_command";
    j["message"] = "unknown command '" + command + "' (try help)";
    return j;
}

size_t CommandShell::run(std::istream& in, std::ostream& out, const std::function<bool()>& keep_running) {
    size_t executed = 0;
    std::string line;
    while (!quit_requested_ && (!keep_running || keep_running()) && std::getline(in, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        out << execute(line).dump() << std::endl;
        ++executed;
    }
    return executed;
}

// ===================================================================
// COMMAND HANDLERS
// ===================================================================

nlohmann::json CommandShell::handleCreate(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return usageReply("create [owner]");
    }
    std::optional<std::string> owner;
    if (!args.empty()) {
        owner = args[0];
    }
    auto created = manager_->create(owner);
    if (!created.ok()) {
        return errorReply(created.error());
    }
    nlohmann::json j = okReply();
    j["session"] = created.value().toJson();
    return j;
}

nlohmann::json CommandShell::handleGet(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usageReply("get <id>");
    }
    std::optional<SessionId> id;
    nlohmann::json error;
    if (!parseId(args[0], id, error)) {
        return error;
    }
    auto found = manager_->get(*id);
    if (!found.ok()) {
        return errorReply(found.error());
    }
    nlohmann::json j = okReply();
    j["session"] = found.value().toJson();
    return j;
}

nlohmann::json CommandShell::handleTouch(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usageReply("touch <id>");
    }
    std::optional<SessionId> id;
    nlohmann::json error;
    if (!parseId(args[0], id, error)) {
        return error;
    }
    auto refreshed = manager_->getAndRefresh(*id);
    if (!refreshed.ok()) {
        return errorReply(refreshed.error());
    }
    nlohmann::json j = okReply();
    j["session"] = refreshed.value().toJson();
    return j;
}

nlohmann::json CommandShell::handleRefresh(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usageReply("refresh <id>");
    }
    std::optional<SessionId> id;
    nlohmann::json error;
    if (!parseId(args[0], id, error)) {
        return error;
    }
    auto refreshed = manager_->refresh(*id);
    return refreshed.ok() ? okReply() : errorReply(refreshed.error());
}

nlohmann::json CommandShell::handleRemove(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usageReply("remove <id>");
    }
    std::optional<SessionId> id;
    nlohmann::json error;
    if (!parseId(args[0], id, error)) {
        return error;
    }
    auto removed = manager_->remove(*id);
    if (!removed.ok()) {
        return errorReply(removed.error());
    }
    nlohmann::json j = okReply();
    j["removed"] = removed.value().has_value();
    if (removed.value()) {
        j["session"] = removed.value()->toJson();
    }
    return j;
}

nlohmann::json CommandShell::handleRevoke(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usageReply("revoke <owner>");
    }
    auto removed = manager_->removeAllForOwner(args[0]);
    if (!removed.ok()) {
        return errorReply(removed.error());
    }
    if (logger_) {
        logger_->info("Operator revoked sessions for owner: " + args[0]);
    }
    nlohmann::json j = okReply();
    j["removed"] = removed.value();
    return j;
}

nlohmann::json CommandShell::handleCleanup() {
    auto removed = manager_->cleanupExpired();
    if (!removed.ok()) {
        return errorReply(removed.error());
    }
    nlohmann::json j = okReply();
    j["removed"] = removed.value();
    return j;
}

nlohmann::json CommandShell::handleCount() {
    auto active = manager_->activeCount();
    if (!active.ok()) {
        return errorReply(active.error());
    }
    nlohmann::json j = okReply();
    j["active"] = active.value();
    return j;
}

nlohmann::json CommandShell::handleSize() {
    auto size = manager_->size();
    if (!size.ok()) {
        return errorReply(size.error());
    }
    nlohmann::json j = okReply();
    j["size"] = size.value();
    return j;
}

nlohmann::json CommandShell::handleStats() {
    auto stats = manager_->stats();
    if (!stats.ok()) {
        return errorReply(stats.error());
    }
    const SessionStats& s = stats.value();
    nlohmann::json j = okReply();
    j["total"] = s.total;
    j["active"] = s.active;
    j["expired"] = s.expired;
    j["authenticated"] = s.authenticated;
    j["max_sessions"] = manager_->config().max_sessions;
    j["max_sessions_per_owner"] = manager_->config().max_sessions_per_owner;
    j["timeout_ms"] = manager_->config().timeout.count();
    return j;
}

nlohmann::json CommandShell::handleOwner(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usageReply("owner <name>");
    }
    auto sessions = manager_->sessionsForOwner(args[0]);
    if (!sessions.ok()) {
        return errorReply(sessions.error());
    }
    nlohmann::json j = okReply();
    j["sessions"] = nlohmann::json::array();
    for (const auto& record : sessions.value()) {
        j["sessions"].push_back(record.toJson());
    }
    return j;
}

nlohmann::json CommandShell::handleMeta(const std::vector<std::string>& args, const std::string& value) {
    if (args.size() < 3) {
        return usageReply("meta <id> <key> <value>");
    }
    std::optional<SessionId> id;
    nlohmann::json error;
    if (!parseId(args[0], id, error)) {
        return error;
    }
    auto updated = manager_->setMetadata(*id, args[1], value);
    return updated.ok() ? okReply() : errorReply(updated.error());
}

nlohmann::json CommandShell::handleAuth(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usageReply("auth <id>");
    }
    std::optional<SessionId> id;
    nlohmann::json error;
    if (!parseId(args[0], id, error)) {
        return error;
    }
    auto updated = manager_->markAuthenticated(*id);
    return updated.ok() ? okReply() : errorReply(updated.error());
}

nlohmann::json CommandShell::handleReset() {
    if (logger_) {
        logger_->warn("Operator requested session store reset");
    }
    size_t discarded = manager_->resetStore();
    nlohmann::json j = okReply();
    j["discarded"] = discarded;
    return j;
}

nlohmann::json CommandShell::handleHelp() const {
    nlohmann::json j = okReply();
    j["commands"] = {
        "create [owner]", "get <id>", "touch <id>", "refresh <id>", "remove <id>",
        "revoke <owner>", "cleanup", "count", "size", "stats", "owner <name>", "meta <id> <key> <value>",
        "auth <id>", "reset", "help", "quit"
    };
    return j;
}

// ===================================================================
// HELPER METHODS
// ===================================================================

bool CommandShell::parseId(const std::string& text, std::optional<SessionId>& id, nlohmann::json& error) const {
    auto parsed = SessionId::parse(text, manager_->idGenerator().prefix());
    if (!parsed.ok()) {
        error = errorReply(parsed.error());
        return false;
    }
    id = parsed.value();
    return true;
}

nlohmann::json CommandShell::okReply() {
    nlohmann::json j;
    j["ok"] = true;
    return j;
}

nlohmann::json CommandShell::errorReply(const SessionError& error) {
    nlohmann::json j;
    j["ok"] = false;
    j["error"] = toString(error.kind());
    j["message"] = error.message();
    return j;
}

nlohmann::json CommandShell::usageReply(const std::string& usage) {
    nlohmann::json j;
    j["ok"] = false;
    j["error"] = "usage";
    j["message"] = "usage: " + usage;
    return j;
}
