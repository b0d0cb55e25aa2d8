#include "valsim_harness/process_bridge.hpp"
#include "valsim_harness/interrupt.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace valsim::harness::process_bridge {

namespace {

// Only async-signal-safe calls between fork() and exec.
[[noreturn]] void exec_child(const std::string& work_dir, const std::string& in_file,
                             const std::string& out_file, const std::string& err_file,
                             const std::vector<char*>& argv) {
    if (chdir(work_dir.c_str()) != 0) {
        _exit(127);
    }
    const int in_fd = open(in_file.c_str(), O_RDONLY);
    if (in_fd >= 0) {
        dup2(in_fd, STDIN_FILENO);
        close(in_fd);
    }
    const int out_fd = open(out_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    const int err_fd = open(err_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (out_fd < 0 || err_fd < 0) {
        _exit(127);
    }
    dup2(out_fd, STDOUT_FILENO);
    dup2(err_fd, STDERR_FILENO);
    close(out_fd);
    close(err_fd);

    // The harness may have installed its own SIGINT handler; the child gets the default.
    signal(SIGINT, SIG_DFL);

    execvp(argv[0], argv.data());
    _exit(127);
}

}  // namespace

ProcessCalculator::ProcessCalculator(fs::path work_dir, std::vector<std::string> argv)
    : work_dir_{std::move(work_dir)}, argv_{std::move(argv)}
{
    if (argv_.empty()) {
        throw std::invalid_argument("ProcessCalculator: empty command");
    }
}

void ProcessCalculator::run()
{
    const auto marker = work_dir_ / kFinishedMarker;
    std::error_code ec;
    fs::remove(marker, ec);
    if (ec) {
        throw std::runtime_error("Failed to remove " + marker.string() + ": " + ec.message());
    }

    // Prepared before fork(); the child must not allocate.
    const std::string dir = work_dir_.string();
    const std::string in_file = (work_dir_ / "STDIN").string();
    const std::string out_file = (work_dir_ / "STDOUT").string();
    const std::string err_file = (work_dir_ / "STDERR").string();
    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for (auto& arg : argv_) {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        exec_child(dir, in_file, out_file, err_file, args);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFSIGNALED(status)) {
        if (WTERMSIG(status) == SIGINT) {
            throw Interrupted("'" + argv_.front() + "' interrupted");
        }
        throw std::runtime_error("'" + argv_.front() + "' killed by signal " +
                                 std::to_string(WTERMSIG(status)));
    }
    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (code == 127) {
        throw std::runtime_error("'" + argv_.front() + "' could not be executed (exit code 127)");
    }
    if (code != 0) {
        throw std::runtime_error("'" + argv_.front() + "' failed with exit code " + std::to_string(code));
    }

    std::ofstream touch(marker);
    if (!touch) {
        throw std::runtime_error("Failed to create " + marker.string());
    }
}

bool ProcessCalculator::runfinished()
{
    std::error_code ec;
    return fs::exists(work_dir_ / kFinishedMarker, ec);
}

}  // namespace valsim::harness::process_bridge
