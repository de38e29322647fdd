#include "CommandRunner.h"
#include "../core/Logging.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace link_scope {

static const size_t kMaxCapture = 1 * 1024 * 1024;

CommandResult ProcessRunner::run(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const {
    CommandResult res;
    if(args.empty()) return res;

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(args.size()+1);
    for(const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int fds[2];
    if(pipe2(fds, O_CLOEXEC) != 0){
        Logger::instance().debug("pipe failed for " + args[0] + ": " + std::strerror(errno));
        return res;
    }
    int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);

    pid_t pid = fork();
    if(pid < 0){
        Logger::instance().debug("fork failed for " + args[0] + ": " + std::strerror(errno));
        close(fds[0]); close(fds[1]);
        if(devnull >= 0) close(devnull);
        return res;
    }
    if(pid == 0){
        dup2(fds[1], STDOUT_FILENO);
        if(devnull >= 0) dup2(devnull, STDERR_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }
    close(fds[1]);
    if(devnull >= 0) close(devnull);
    res.started = true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    while(true){
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if(remaining <= 0){ res.timed_out = true; break; }
        pollfd pfd{fds[0], POLLIN, 0};
        int pr = poll(&pfd, 1, static_cast<int>(remaining));
        if(pr < 0){ if(errno == EINTR) continue; break; }
        if(pr == 0){ res.timed_out = true; break; }
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if(n < 0){ if(errno == EINTR) continue; break; }
        if(n == 0) break; // EOF
        if(res.output.size() < kMaxCapture) res.output.append(buf, static_cast<size_t>(n));
    }
    close(fds[0]);

    if(res.timed_out) kill(pid, SIGKILL);
    int status = 0;
    while(waitpid(pid, &status, 0) < 0){
        if(errno != EINTR){ return res; }
    }
    if(WIFEXITED(status)){
        res.exit_code = WEXITSTATUS(status);
        // execvp failure in the child
        if(res.exit_code == 127) Logger::instance().trace("command exited 127 (not found?): " + args[0]);
    }
    return res;
}

}
