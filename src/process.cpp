#include "commitgate/process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace commitgate {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound on how long a child's exit can go unnoticed.
constexpr int kPollSliceMs = 20;

bool is_executable_file(const std::filesystem::path &p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0)
    return false;
  return S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

std::optional<std::filesystem::path> find_executable(std::string_view name) {
  if (name.empty())
    return std::nullopt;
  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path p{std::string(name)};
    if (is_executable_file(p))
      return p;
    return std::nullopt;
  }

  const char *env = std::getenv("PATH");
  std::string_view path_var = env ? env : "/usr/local/bin:/usr/bin:/bin";
  while (true) {
    const auto colon = path_var.find(':');
    std::string_view dir = path_var.substr(0, colon);
    // An empty PATH element means the current directory.
    std::filesystem::path candidate =
        dir.empty() ? std::filesystem::path(".") : std::filesystem::path(std::string(dir));
    candidate /= std::string(name);
    if (is_executable_file(candidate))
      return candidate;
    if (colon == std::string_view::npos)
      break;
    path_var.remove_prefix(colon + 1);
  }
  return std::nullopt;
}

ProcessResult run_process(const Command &cmd, std::chrono::milliseconds timeout) {
  if (cmd.argv.empty())
    throw std::runtime_error("run_process: empty command");

  const auto start = Clock::now();
  ProcessResult result;

  // [0] stdin (child reads), [1] stdout, [2] stderr
  int pipes[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
  auto close_all = [&] {
    for (auto &p : pipes) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };
  const bool feed = !cmd.input.empty();
  for (int i = feed ? 0 : 1; i < 3; ++i) {
    if (::pipe(pipes[i]) != 0) {
      const int saved = errno;
      close_all();
      throw std::runtime_error(std::string("pipe failed: ") + std::strerror(saved));
    }
  }

  std::vector<char *> c_args;
  c_args.reserve(cmd.argv.size() + 1);
  for (const auto &a : cmd.argv)
    c_args.push_back(const_cast<char *>(a.c_str()));
  c_args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int saved = errno;
    close_all();
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    if (feed) {
      ::dup2(pipes[0][0], STDIN_FILENO);
    } else {
      const int devnull = ::open("/dev/null", O_RDONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
      }
    }
    ::dup2(pipes[1][1], STDOUT_FILENO);
    ::dup2(pipes[2][1], STDERR_FILENO);
    for (auto &p : pipes) {
      if (p[0] >= 0)
        ::close(p[0]);
      if (p[1] >= 0)
        ::close(p[1]);
    }
    if (!cmd.cwd.empty() && ::chdir(cmd.cwd.c_str()) != 0)
      ::_exit(127);
    ::execvp(c_args[0], c_args.data());
    ::_exit(127);
  }

  result.launched = true;
  close_fd(pipes[0][0]);
  close_fd(pipes[1][1]);
  close_fd(pipes[2][1]);

  // A child that exits before reading all of its input must not kill us.
  struct sigaction ignore_pipe {};
  struct sigaction saved_pipe {};
  ignore_pipe.sa_handler = SIG_IGN;
  ::sigaction(SIGPIPE, &ignore_pipe, &saved_pipe);

  int in_fd = pipes[0][1];
  int fds[2] = {pipes[1][0], pipes[2][0]};
  std::string *sinks[2] = {&result.out, &result.err};
  for (const int fd : {in_fd, fds[0], fds[1]}) {
    if (fd >= 0)
      ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
  }
  std::size_t in_off = 0;
  char buf[8192];

  // Read whatever is buffered right now; EOF or EAGAIN ends it.
  auto drain = [&](int i) {
    while (fds[i] >= 0) {
      const ssize_t got = ::read(fds[i], buf, sizeof(buf));
      if (got > 0) {
        sinks[i]->append(buf, static_cast<std::size_t>(got));
      } else if (got < 0 && errno == EINTR) {
        continue;
      } else {
        if (got == 0 || (errno != EAGAIN && errno != EWOULDBLOCK))
          close_fd(fds[i]);
        return;
      }
    }
  };

  // The direct child's exit ends the run, not EOF on the pipes: a tool may
  // close its output early, or leave a background process holding it open.
  const bool bounded = timeout.count() > 0;
  const auto deadline = start + timeout;
  int status = 0;
  bool reaped = false;
  while (true) {
    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      reaped = true;
      break;
    }
    if (w < 0 && errno != EINTR) {
      status = -1;
      reaped = true;
      break;
    }

    int wait_ms = kPollSliceMs;
    if (bounded) {
      const auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      if (left.count() <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<long long>(left.count(), kPollSliceMs));
    }

    pollfd pfds[3];
    nfds_t n = 0;
    int owner[3] = {-1, -1, -1};
    for (int i = 0; i < 2; ++i) {
      if (fds[i] >= 0) {
        pfds[n] = pollfd{.fd = fds[i], .events = POLLIN, .revents = 0};
        owner[n++] = i;
      }
    }
    if (in_fd >= 0) {
      pfds[n] = pollfd{.fd = in_fd, .events = POLLOUT, .revents = 0};
      owner[n++] = 2;
    }
    if (::poll(pfds, n, wait_ms) <= 0)
      continue; // timeout slice or EINTR; exit and deadline are re-checked

    for (nfds_t j = 0; j < n; ++j) {
      if (pfds[j].revents == 0)
        continue;
      if (owner[j] < 2) {
        drain(owner[j]);
        continue;
      }
      const ssize_t put = ::write(in_fd, cmd.input.data() + in_off, cmd.input.size() - in_off);
      if (put > 0)
        in_off += static_cast<std::size_t>(put);
      else if (put < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK)
        close_fd(in_fd);
      if (in_off == cmd.input.size())
        close_fd(in_fd);
    }
  }

  if (result.timed_out) {
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }
  close_fd(in_fd);
  drain(0);
  drain(1);
  close_fd(fds[0]);
  close_fd(fds[1]);
  ::sigaction(SIGPIPE, &saved_pipe, nullptr);

  if (result.timed_out || !reaped || status == -1)
    result.exit_code = -1;
  else
    result.exit_code = decode_status(status);
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
  return result;
}

std::vector<std::string> split_command(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  bool in_word = false;
  char quote = 0;
  for (const char c : text) {
    if (quote) {
      if (c == quote)
        quote = 0;
      else
        cur.push_back(c);
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      in_word = true;
    } else if (c == ' ' || c == '\t') {
      if (in_word) {
        out.push_back(std::move(cur));
        cur.clear();
        in_word = false;
      }
    } else {
      cur.push_back(c);
      in_word = true;
    }
  }
  if (quote)
    throw std::runtime_error("unterminated quote in command: " + std::string(text));
  if (in_word)
    out.push_back(std::move(cur));
  return out;
}

std::string join_command(const std::vector<std::string> &argv) {
  std::string s;
  for (const auto &a : argv) {
    if (!s.empty())
      s.push_back(' ');
    if (a.empty() || a.find_first_of(" \t") != std::string::npos)
      s += "\"" + a + "\"";
    else
      s += a;
  }
  return s;
}

bool SystemRunner::resolvable(std::string_view program) const {
  return find_executable(program).has_value();
}

ProcessResult SystemRunner::run(const Command &cmd, std::chrono::milliseconds timeout) {
  return run_process(cmd, timeout);
}

} // namespace commitgate
