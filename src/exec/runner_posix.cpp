/*
 * POSIX command runner implementation - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdgate/exec/runner.hpp>
#include <ai-cmdgate/lex/lexer.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cmdgate {

std::optional<std::vector<std::string>> split_argv(const std::string& command, std::string* error) {
    auto ts = Lexer(command).run();
    std::vector<std::string> argv;
    bool line_ended = false;
    for (auto &t : ts) {
        if (t.kind == TokenKind::Eof) break;
        if (t.kind == TokenKind::Newline) { line_ended = true; continue; }
        if (t.kind == TokenKind::Word && !line_ended) { argv.push_back(t.lexeme); continue; }
        if (error) {
            if (t.kind == TokenKind::Invalid) *error = "unbalanced quotes";
            else if (line_ended) *error = "argv mode runs a single line";
            else *error = "argv mode does not support '" + t.lexeme + "'";
        }
        return std::nullopt;
    }
    if (argv.empty()) { if (error) *error = "no program name"; return std::nullopt; }
    return argv;
}

namespace {

struct Pipe {
    int rd = -1, wr = -1;
    ~Pipe() { close_rd(); close_wr(); }
    bool open() {
        int p[2];
        if (pipe(p) != 0) return false;
        rd = p[0]; wr = p[1];
        fcntl(rd, F_SETFD, FD_CLOEXEC);
        fcntl(wr, F_SETFD, FD_CLOEXEC);
        return true;
    }
    void close_rd() { if (rd != -1) { ::close(rd); rd = -1; } }
    void close_wr() { if (wr != -1) { ::close(wr); wr = -1; } }
};

int decode_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return 1;
}

void reap(pid_t pid, int& st) {
    while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
}

// Read what is available on `fd` into `sink`; closes the pipe end on EOF.
void drain(int& fd, std::string& sink, std::size_t cap) {
    char buf[4096];
    ssize_t n = ::read(fd, buf, sizeof buf);
    if (n > 0) {
        std::size_t room = sink.size() < cap ? cap - sink.size() : 0;
        sink.append(buf, std::min<std::size_t>(room, static_cast<std::size_t>(n)));
        return;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return;
    ::close(fd); fd = -1;
}

} // namespace

ExecutionOutcome PosixRunner::run(const std::string& command, std::chrono::seconds timeout, ExecMode mode) {
    using clock = std::chrono::steady_clock;
    auto started = clock::now();
    ExecutionOutcome out;
    auto finish = [&](ExitStatus st) {
        out.status = std::move(st);
        out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);
        return out;
    };

    if (timeout.count() <= 0) return finish(Failed{"timeout must be positive"});

    std::vector<std::string> words;
    if (mode == ExecMode::Argv) {
        std::string err;
        auto argv = split_argv(command, &err);
        if (!argv) return finish(Failed{err});
        words = std::move(*argv);
    } else {
        words = {m_opts.shell, "-c", command};
    }
    // Built before fork: the child only makes async-signal-safe calls.
    std::vector<char*> cargv; cargv.reserve(words.size()+1);
    for (auto &s : words) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    Pipe out_pipe, err_pipe, exec_pipe;
    if (!out_pipe.open() || !err_pipe.open() || !exec_pipe.open())
        return finish(Failed{std::string("pipe: ") + std::strerror(errno)});

    pid_t pid = fork();
    if (pid < 0) return finish(Failed{std::string("fork: ") + std::strerror(errno)});
    if (pid == 0) {
        setpgid(0,0);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); ::close(devnull); } else { ::close(STDIN_FILENO); }
        dup2(out_pipe.wr, STDOUT_FILENO);
        dup2(err_pipe.wr, STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        int e = errno;
        while (::write(exec_pipe.wr, &e, sizeof e) < 0 && errno == EINTR) {}
        _exit(127);
    }
    setpgid(pid, pid); // also done in the child; whichever runs first wins
    out_pipe.close_wr(); err_pipe.close_wr(); exec_pipe.close_wr();

    // exec_pipe is close-on-exec: EOF means execvp succeeded, an int means it failed.
    int exec_errno = 0; ssize_t n;
    while ((n = ::read(exec_pipe.rd, &exec_errno, sizeof exec_errno)) < 0 && errno == EINTR) {}
    if (n == static_cast<ssize_t>(sizeof exec_errno)) {
        int st = 0; reap(pid, st);
        return finish(Failed{std::string("exec ") + words[0] + ": " + std::strerror(exec_errno)});
    }

    auto deadline = started + timeout;
    int fds[2] = {out_pipe.rd, err_pipe.rd};
    bool child_done = false, timed_out = false;
    while (true) {
        if (!child_done) {
            // WNOWAIT keeps the child as a zombie, so its pgid cannot be recycled before killpg.
            siginfo_t si{};
            if (waitid(P_PID, static_cast<id_t>(pid), &si, WEXITED | WNOHANG | WNOWAIT) == 0 && si.si_pid == pid) {
                child_done = true;
                killpg(pid, SIGKILL);
            }
        }
        if (fds[0] < 0 && fds[1] < 0 && child_done) break;
        auto now = clock::now();
        if (now >= deadline) {
            if (!child_done) { timed_out = true; killpg(pid, SIGKILL); }
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<long long>(remaining, 50));

        pollfd pfd[2]; nfds_t count = 0; int which[2];
        for (int i=0;i<2;++i) if (fds[i] >= 0) { pfd[count] = {fds[i], POLLIN, 0}; which[count] = i; ++count; }
        if (count == 0) {
            // Streams closed but the child is still running.
            ::poll(nullptr, 0, wait_ms);
            continue;
        }
        int r = ::poll(pfd, count, wait_ms);
        if (r < 0) {
            if (errno == EINTR) continue;
            killpg(pid, SIGKILL);
            int st = 0; reap(pid, st);
            return finish(Failed{std::string("poll: ") + std::strerror(errno)});
        }
        for (nfds_t i=0;i<count;++i) {
            if (pfd[i].revents == 0) continue;
            std::string& sink = which[i] == 0 ? out.stdout_data : out.stderr_data;
            drain(fds[which[i]], sink, m_opts.max_output_bytes);
        }
    }
    // drain() may have closed the read ends already.
    out_pipe.rd = fds[0]; err_pipe.rd = fds[1];

    int st = 0; reap(pid, st);
    if (timed_out) return finish(TimedOut{});
    return finish(Exited{decode_status(st)});
}

} // namespace cmdgate
