#include "plugin_process.hpp"

#include "../logger.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <stdexcept>
#include <thread>
#include <utility>

#include <log4cplus/loggingmacros.h>

namespace apiproxy::host {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

PluginProcess::PluginProcess(PluginProcessConfig config) : config_(std::move(config)) {
    LOG4CPLUS_DEBUG(host_logger(), "Spawning plugin process: " << config_.executable);

    // The host must see a dead plugin as a failed write, not die of SIGPIPE.
    signal(SIGPIPE, SIG_IGN);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        throw std::runtime_error(errno_message("Failed to create stdin pipe"));
    }
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        std::string message = errno_message("Failed to create stdout pipe");
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        throw std::runtime_error(message);
    }
    // Reports exec failure from the child; closed by a successful exec.
    if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        std::string message = errno_message("Failed to create exec status pipe");
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0], &stdout_pipe[1]}) {
            close_fd(*fd);
        }
        throw std::runtime_error(message);
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(config_.executable);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_ = ::fork();
    if (pid_ < 0) {
        std::string message = errno_message("fork() failed");
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0], &stdout_pipe[1], &exec_pipe[0],
                        &exec_pipe[1]}) {
            close_fd(*fd);
        }
        throw std::runtime_error(message);
    }

    if (pid_ == 0) {
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(exec_pipe[1]);
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
        wait_exit(std::chrono::milliseconds(1000));
        throw std::runtime_error("Failed to exec " + config_.executable + ": " + std::strerror(child_errno));
    }

    LOG4CPLUS_INFO(host_logger(), "Started plugin " << config_.executable << " pid=" << pid_);
}

PluginProcess::~PluginProcess() {
    if (pid_ > 0 && !reaped_) {
        terminate(std::chrono::milliseconds(2000));
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
}

void PluginProcess::close_stdin() {
    close_fd(stdin_fd_);
}

bool PluginProcess::wait_exit(std::chrono::milliseconds timeout) {
    if (reaped_) {
        return true;
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        pid_t result = ::waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            reaped_ = true;
            exit_status_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return true;
        }
        if (result < 0 && errno != EINTR) {
            reaped_ = true;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool PluginProcess::is_alive() {
    if (pid_ <= 0 || reaped_) {
        return false;
    }
    return !wait_exit(std::chrono::milliseconds(0));
}

int PluginProcess::terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0) {
        return -1;
    }
    close_stdin();
    if (wait_exit(grace)) {
        return exit_status_;
    }

    LOG4CPLUS_WARN(host_logger(), "Plugin " << config_.executable << " did not exit, sending SIGTERM");
    ::kill(pid_, SIGTERM);
    if (wait_exit(std::chrono::milliseconds(1000))) {
        return exit_status_;
    }

    LOG4CPLUS_WARN(host_logger(), "Plugin " << config_.executable << " ignored SIGTERM, sending SIGKILL");
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
    exit_status_ = -1;
    return exit_status_;
}

} // namespace apiproxy::host
