#include <kiln/process.hpp>
#include <kiln/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kiln {

namespace {

KilnError os_error(const std::string& what) {
    return KilnError{KilnError::IO, what + " failed: " + std::strerror(errno)};
}

// Both ends of a pipe, closed on scope exit
struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        close_read();
        close_write();
    }
    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    void close_read() {
        if (fds[0] >= 0) ::close(fds[0]);
        fds[0] = -1;
    }
    void close_write() {
        if (fds[1] >= 0) ::close(fds[1]);
        fds[1] = -1;
    }
};

// Read whatever is available without blocking
void pump(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        return;
    }
}

std::string search_path(const std::optional<EnvMap>& env) {
    std::string path;
    if (env) {
        auto it = env->find("PATH");
        if (it != env->end()) path = it->second;
    } else if (const char* p = std::getenv("PATH")) {
        path = p;
    }
    return path.empty() ? "/usr/local/bin:/usr/bin:/bin" : path;
}

// PATH lookup happens before fork; the child only calls exec
std::string find_executable(const std::string& name, const std::string& path) {
    if (name.find('/') != std::string::npos) return name;
    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return "";
}

[[noreturn]] void exec_child(const std::string& exe, char* const* argv, char* const* envp,
                             const std::string& working_dir, Pipe& out, Pipe& err) {
    // New process group so a timeout also reaches grandchildren
    ::setpgid(0, 0);
    ::dup2(out.write_end(), STDOUT_FILENO);
    ::dup2(err.write_end(), STDERR_FILENO);
    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        if (null_fd > STDERR_FILENO) ::close(null_fd);
    }

    if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) _exit(127);
    if (envp) ::execve(exe.c_str(), argv, envp);
    else ::execv(exe.c_str(), argv);
    _exit(127);
}

} // namespace

std::string format_command(const std::vector<std::string>& args) {
    std::ostringstream out;
    const char* sep = "";
    for (const auto& a : args) {
        out << sep;
        sep = " ";
        bool quote = a.find_first_of(" \t\"'") != std::string::npos;
        if (quote) out << '\'' << a << '\'';
        else out << a;
    }
    return out.str();
}

std::string output_tail(const std::string& output, size_t max_lines) {
    std::vector<std::string> kept;
    std::istringstream in(output);
    for (std::string line; std::getline(in, line);) {
        if (line.empty()) continue;
        kept.push_back(line);
        if (kept.size() > max_lines) kept.erase(kept.begin());
    }
    std::string tail;
    for (const auto& line : kept) {
        if (!tail.empty()) tail += '\n';
        tail += line;
    }
    return tail;
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds,
                                  const std::optional<EnvMap>& env) {
    if (args.empty()) {
        return KilnError{KilnError::InvalidArg, "run_command: no command given"};
    }
    if (timeout_seconds <= 0) {
        return KilnError{KilnError::InvalidArg,
            "run_command: timeout must be positive, got " + std::to_string(timeout_seconds)};
    }

    const std::string path = search_path(env);
    const std::string exe = find_executable(args[0], path);
    if (exe.empty()) {
        return KilnError{KilnError::NotFound, "command not found: " + args[0],
                         "searched PATH=" + path};
    }

    std::vector<char*> argv;
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_entries;
    std::vector<char*> envp;
    if (env) {
        for (const auto& kv : *env) env_entries.push_back(kv.first + "=" + kv.second);
        for (auto& entry : env_entries) envp.push_back(&entry[0]);
        envp.push_back(nullptr);
    }

    Pipe out, err;
    if (!out.open() || !err.open()) return os_error("pipe()");

    log::trace("exec: %s", format_command(args).c_str());

    pid_t pid = ::fork();
    if (pid < 0) return os_error("fork()");
    if (pid == 0) {
        exec_child(exe, argv.data(), env ? envp.data() : nullptr, working_dir, out, err);
    }

    out.close_write();
    err.close_write();
    ::fcntl(out.read_end(), F_SETFL, O_NONBLOCK);
    ::fcntl(err.read_end(), F_SETFL, O_NONBLOCK);

    CommandResult result{-1, "", ""};
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);

    while (true) {
        pollfd fds[] = {{out.read_end(), POLLIN, 0}, {err.read_end(), POLLIN, 0}};
        ::poll(fds, 2, 20);
        pump(out.read_end(), result.stdout_str);
        pump(err.read_end(), result.stderr_str);

        int status = 0;
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            pump(out.read_end(), result.stdout_str);
            pump(err.read_end(), result.stderr_str);
            result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(std::move(result));
        }
        if (done < 0 && errno != EINTR) return os_error("waitpid()");

        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            KilnError timeout{KilnError::Timeout,
                "command timed out after " + std::to_string(timeout_seconds) + "s: " +
                format_command(args)};
            timeout.cause = output_tail(result.stderr_str);
            return timeout;
        }
    }
}

} // namespace kiln
