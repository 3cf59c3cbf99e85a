// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcprouter
{

namespace
{
    void ignoreSigpipe()
    {
        // A server that dies mid-write must surface as a write error, not kill the router.
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    /// Polls for child exit until the deadline passes. Returns true once the child is reaped.
    auto waitForExit(pid_t pid, std::chrono::milliseconds grace, int& status) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + grace;
        while (true)
        {
            auto const rc = ::waitpid(pid, &status, WNOHANG);
            if (rc == pid)
                return true;
            if (rc < 0 && errno != EINTR)
                return true; // already reaped elsewhere
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    bool connected = false;
    std::string command;
    std::chrono::milliseconds shutdownGrace {};
    std::string readBuffer;

    void closePipes()
    {
        if (stdinWrite >= 0)
        {
            ::close(stdinWrite);
            stdinWrite = -1;
        }
        if (stdoutRead >= 0)
        {
            ::close(stdoutRead);
            stdoutRead = -1;
        }
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    if (auto result = close(); !result)
        log::warning("{}", result.error().message);
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (config.command.empty())
        return makeError(ErrorCode::TransportError, "No command given for stdio transport");

    ignoreSigpipe();

    int stdinPipe[2];
    int stdoutPipe[2];

    // Close-on-exec: servers spawned later must not inherit these ends.
    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, stdinPipe[1]);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[0]);

    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Inherited environment, with configured overrides replacing same-named entries.
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->command = config.command;
    _impl->shutdownGrace = config.shutdownGrace;
    _impl->readBuffer.clear();
    _impl->connected = true;

    log::debug("Spawned MCP server '{}' (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = json::dump(message) + "\n";
    auto remaining = std::string_view(data);

    while (!remaining.empty())
    {
        auto const written = ::write(_impl->stdinWrite, remaining.data(), remaining.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to '{}' stdin: {}", _impl->command, strerror(errno)));
        }
        remaining.remove_prefix(static_cast<size_t>(written));
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            return json::parse(line);
        }

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, std::format("'{}' closed its stdout", _impl->command));
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

auto StdioTransport::close() -> VoidResult
{
    if (_impl->childPid <= 0)
    {
        _impl->closePipes();
        _impl->connected = false;
        return {};
    }

    _impl->connected = false;
    _impl->closePipes();

    auto const pid = _impl->childPid;
    _impl->childPid = -1;

    // Closing stdin asks a well-behaved server to exit; escalate if it does not.
    int status = 0;
    if (waitForExit(pid, _impl->shutdownGrace, status))
    {
        log::debug("MCP server '{}' exited", _impl->command);
        return {};
    }

    ::kill(pid, SIGTERM);
    if (waitForExit(pid, _impl->shutdownGrace, status))
    {
        log::debug("MCP server '{}' terminated", _impl->command);
        return {};
    }

    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {
    }
    return makeError(ErrorCode::CloseError,
                     std::format("MCP server '{}' (pid {}) did not exit and was killed", _impl->command, pid));
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace mcprouter
