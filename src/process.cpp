#include "gitpile/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace gitpile {

namespace {

// Pipe whose ends are closed on destruction unless released
struct Pipe {
  int fd[2] = {-1, -1};

  Pipe() {
    if (::pipe2(fd, O_CLOEXEC) != 0)
      throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  ~Pipe() {
    close_read();
    close_write();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  void close_read() {
    if (fd[0] >= 0)
      ::close(fd[0]);
    fd[0] = -1;
  }
  void close_write() {
    if (fd[1] >= 0)
      ::close(fd[1]);
    fd[1] = -1;
  }
};

[[noreturn]] void exec_child(const std::vector<std::string> &argv, const ProcessOptions &options,
                             Pipe &in, Pipe &out, Pipe &err) {
  ::dup2(in.fd[0], STDIN_FILENO);
  ::dup2(out.fd[1], STDOUT_FILENO);
  ::dup2(err.fd[1], STDERR_FILENO);

  if (options.cwd && ::chdir(options.cwd->c_str()) != 0) {
    const std::string msg = "cannot chdir to " + options.cwd->string() + "\n";
    (void)!::write(STDERR_FILENO, msg.data(), msg.size());
    ::_exit(127);
  }

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  ::execvp(args[0], args.data());
  const std::string msg = "cannot execute " + argv[0] + ": " + std::strerror(errno) + "\n";
  (void)!::write(STDERR_FILENO, msg.data(), msg.size());
  ::_exit(127);
}

} // namespace

ProcessResult run_process(const std::vector<std::string> &argv, const ProcessOptions &options) {
  if (argv.empty())
    throw std::invalid_argument("run_process: empty argument vector");

  Pipe in, out, err;

  const pid_t pid = ::fork();
  if (pid < 0)
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
  if (pid == 0)
    exec_child(argv, options, in, out, err);

  // Parent keeps the write end of stdin and the read ends of stdout/stderr
  in.close_read();
  out.close_write();
  err.close_write();
  ::fcntl(in.fd[1], F_SETFL, ::fcntl(in.fd[1], F_GETFL) | O_NONBLOCK);

  // A child that exits before reading its stdin must not kill us with SIGPIPE
  struct sigaction ignore{}, previous{};
  ignore.sa_handler = SIG_IGN;
  ::sigaction(SIGPIPE, &ignore, &previous);

  ProcessResult result;
  std::size_t written = 0;
  if (options.stdin_data.empty())
    in.close_write();

  char buffer[4096];
  while (out.fd[0] >= 0 || err.fd[0] >= 0) {
    pollfd fds[3];
    nfds_t n = 0;
    int out_slot = -1, err_slot = -1, in_slot = -1;
    if (out.fd[0] >= 0) {
      out_slot = static_cast<int>(n);
      fds[n++] = {out.fd[0], POLLIN, 0};
    }
    if (err.fd[0] >= 0) {
      err_slot = static_cast<int>(n);
      fds[n++] = {err.fd[0], POLLIN, 0};
    }
    if (in.fd[1] >= 0) {
      in_slot = static_cast<int>(n);
      fds[n++] = {in.fd[1], POLLOUT, 0};
    }

    if (::poll(fds, n, -1) < 0) {
      if (errno == EINTR)
        continue;
      break;
    }

    auto drain = [&](int slot, Pipe &p, std::string &sink) {
      if (slot < 0 || fds[slot].revents == 0)
        return;
      const ssize_t got = ::read(p.fd[0], buffer, sizeof(buffer));
      if (got > 0)
        sink.append(buffer, static_cast<std::size_t>(got));
      else if (got == 0 || errno != EINTR)
        p.close_read();
    };
    drain(out_slot, out, result.out);
    drain(err_slot, err, result.err);

    if (in_slot >= 0 && fds[in_slot].revents != 0) {
      if (fds[in_slot].revents & (POLLERR | POLLHUP)) {
        in.close_write();
      } else {
        const ssize_t put = ::write(in.fd[1], options.stdin_data.data() + written,
                                    options.stdin_data.size() - written);
        if (put > 0)
          written += static_cast<std::size_t>(put);
        else if (errno != EINTR && errno != EAGAIN)
          in.close_write();
        if (written == options.stdin_data.size())
          in.close_write();
      }
    }
  }
  in.close_write();
  ::sigaction(SIGPIPE, &previous, nullptr);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
  }
  if (WIFEXITED(status))
    result.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exit_code = -WTERMSIG(status);
  return result;
}

} // namespace gitpile
