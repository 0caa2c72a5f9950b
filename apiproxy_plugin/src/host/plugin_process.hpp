#pragma once

#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

namespace apiproxy::host {

struct PluginProcessConfig {
    std::string executable;
    std::vector<std::string> args;
};

/**
 * A spawned plugin executable with its stdin/stdout connected to pipes owned
 * by this object. stderr is inherited so plugin logs reach the daemon's log.
 * Throws std::runtime_error when the process cannot be started.
 */
class PluginProcess {
public:
    explicit PluginProcess(PluginProcessConfig config);
    ~PluginProcess();

    PluginProcess(const PluginProcess&) = delete;
    PluginProcess& operator=(const PluginProcess&) = delete;

    /// Parent end of the child's stdin.
    int stdin_fd() const { return stdin_fd_; }
    /// Parent end of the child's stdout.
    int stdout_fd() const { return stdout_fd_; }
    pid_t pid() const { return pid_; }
    const std::string& executable() const { return config_.executable; }

    /// Signals end of input; a well-behaved plugin exits on its own afterwards.
    void close_stdin();

    bool is_alive();

    /**
     * Closes stdin and waits up to `grace` for a clean exit, then escalates to
     * SIGTERM and SIGKILL. Returns the exit status, or -1 if it was killed.
     */
    int terminate(std::chrono::milliseconds grace);

private:
    bool wait_exit(std::chrono::milliseconds timeout);

    PluginProcessConfig config_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int exit_status_ = -1;
    bool reaped_ = false;
};

} // namespace apiproxy::host
