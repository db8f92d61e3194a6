#include "Process.h"
#include "Errors.h"
#include "Logging.h"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lanprobe {

std::optional<std::string> find_executable(const std::string& name){
    if(name.empty()) return std::nullopt;
    if(name.find('/') != std::string::npos){
        if(access(name.c_str(), X_OK)==0) return name;
        return std::nullopt;
    }
    const char* path = std::getenv("PATH");
    std::string dirs = path && *path ? path : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    size_t start=0;
    while(start <= dirs.size()){
        size_t colon = dirs.find(':', start);
        std::string dir = dirs.substr(start, colon==std::string::npos ? std::string::npos : colon-start);
        if(dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        if(access(cand.c_str(), X_OK)==0) return cand;
        if(colon==std::string::npos) break;
        start = colon+1;
    }
    return std::nullopt;
}

namespace {
struct Pipe {
    int fd[2] = {-1,-1};
    ~Pipe(){ close_read(); close_write(); }
    void close_read(){ if(fd[0]>=0){ ::close(fd[0]); fd[0]=-1; } }
    void close_write(){ if(fd[1]>=0){ ::close(fd[1]); fd[1]=-1; } }
};

std::string describe(const std::vector<std::string>& argv){
    std::string s; for(const auto& a: argv){ if(!s.empty()) s.push_back(' '); s += a; } return s;
}
}

ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout, size_t max_output){
    if(argv.empty()) throw ScanFailure("empty command line");
    auto exe = find_executable(argv[0]);
    if(!exe) throw ScanFailure("'" + argv[0] + "' not found on PATH");

    Pipe out_pipe, err_pipe;
    if(pipe2(out_pipe.fd, O_CLOEXEC)!=0 || pipe2(err_pipe.fd, O_CLOEXEC)!=0)
        throw ScanFailure(std::string("pipe failed: ") + std::strerror(errno));

    Logger::instance().debug("exec: " + describe(argv));
    pid_t pid = fork();
    if(pid < 0) throw ScanFailure(std::string("fork failed: ") + std::strerror(errno));
    if(pid == 0){
        int devnull = ::open("/dev/null", O_RDONLY);
        if(devnull >= 0){ dup2(devnull, STDIN_FILENO); ::close(devnull); }
        dup2(out_pipe.fd[1], STDOUT_FILENO);
        dup2(err_pipe.fd[1], STDERR_FILENO);
        std::vector<char*> args;
        for(const auto& a: argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);
        execv(exe->c_str(), args.data());
        _exit(127);
    }
    out_pipe.close_write(); err_pipe.close_write();

    ProcessResult res;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;
    char buf[4096];
    while(out_pipe.fd[0] >= 0 || err_pipe.fd[0] >= 0){
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if(left <= 0){ timed_out = true; break; }
        pollfd fds[2]; int n=0;
        if(out_pipe.fd[0] >= 0) fds[n++] = {out_pipe.fd[0], POLLIN, 0};
        if(err_pipe.fd[0] >= 0) fds[n++] = {err_pipe.fd[0], POLLIN, 0};
        int rc = poll(fds, n, static_cast<int>(left));
        if(rc < 0){ if(errno==EINTR) continue; kill(pid, SIGKILL); waitpid(pid, nullptr, 0); throw ScanFailure(std::string("poll failed: ") + std::strerror(errno)); }
        if(rc == 0) continue;
        for(int i=0;i<n;i++){
            if(!(fds[i].revents & (POLLIN|POLLHUP|POLLERR))) continue;
            bool is_out = fds[i].fd == out_pipe.fd[0];
            ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if(got < 0 && errno==EINTR) continue;
            if(got <= 0){ if(is_out) out_pipe.close_read(); else err_pipe.close_read(); continue; }
            std::string& dst = is_out ? res.out : res.err;
            size_t room = max_output > dst.size() ? max_output - dst.size() : 0;
            if(static_cast<size_t>(got) > room) res.truncated = true;
            dst.append(buf, std::min(room, static_cast<size_t>(got)));
        }
    }

    if(timed_out){
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        throw ScanFailure("'" + argv[0] + "' timed out after " + std::to_string(timeout.count()) + " ms");
    }

    int status = 0;
    while(waitpid(pid, &status, 0) < 0){
        if(errno != EINTR) throw ScanFailure(std::string("waitpid failed: ") + std::strerror(errno));
    }
    if(WIFSIGNALED(status)){ res.signaled = true; res.signal = WTERMSIG(status); }
    else if(WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    if(res.exit_code == 127 && res.out.empty()) throw ScanFailure("'" + argv[0] + "' could not be executed");
    if(res.truncated) Logger::instance().warn("output of '" + argv[0] + "' truncated at " + std::to_string(max_output) + " bytes");
    return res;
}

}
