// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <core/Log.hpp>

#include <cstring>
#include <format>
#include <thread>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <sys/wait.h>

    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace onyx::process
{

auto spawnDetached(const std::string& command, const std::vector<std::string>& args) -> VoidResult
{
    if (command.empty())
        return makeError(ErrorCode::InvalidArgument, "No command given");

#ifdef _WIN32
    auto cmdLine = std::format("\"{}\"", command);
    for (const auto& arg: args)
        cmdLine += std::format(" \"{}\"", arg);

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi {};
    if (!CreateProcessA(
            nullptr, cmdLine.data(), nullptr, nullptr, FALSE, DETACHED_PROCESS, nullptr, nullptr, &si, &pi))
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to start {} (error {})", command, GetLastError()));

    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
#else
    auto argv = std::vector<char*> {};
    auto cmdCopy = command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid = -1;
    auto const rc = posix_spawnp(&pid, command.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0)
        return makeError(ErrorCode::LaunchError, std::format("Failed to start {}: {}", command, std::strerror(rc)));

    std::thread([pid] {
        auto status = 0;
        ::waitpid(pid, &status, 0);
    }).detach();
#endif

    log::debug("Started {}", command);
    return {};
}

} // namespace onyx::process
