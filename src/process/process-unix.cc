// Copyright (c) 2025 R.J. (kencube@hotmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <chrono>
#include <algorithm>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>

namespace process_lib {

template <>
void maybe_quote_arg<char>(std::string& arg) {
  common::string_replace_all<char>(arg, "\"", "\\\"");

  auto it = arg.find_first_of(" \t"); // contains space?
  if(it != arg.npos) {
    // surround with quotes
    arg.insert(arg.begin(), '"');
    arg += '"';
  }
}

std::vector<std::filesystem::path>
get_sys_paths() {
  std::vector<std::filesystem::path> out;

  const auto *paths = ::getenv("PATH");
  if (paths) {
    for (;;) {
      const char *next = strchr(paths, ':');
      if (next) {
        if (next != paths)
          out.push_back(std::filesystem::path(std::string(paths, next)));
      } else {
        if (*paths)
          out.push_back(std::filesystem::path(std::string(paths)));
        break;
      }
      paths = next + 1;
    }
  }

  return out;
}

Process::FileHandle::~FileHandle() {
  ::close(fd_);
}

bool Process::FileHandle::read(void *buf, size_t size, size_t &got) noexcept {
  ssize_t n;
  do {
    n = ::read(fd_, buf, size);
  } while (n < 0 && errno == EINTR);

  if (n <= 0) {
    return false;
  }

  got = n;
  return true;
}

namespace {

int decode_wait_status(int status, bool &signaled) noexcept {
  signaled = false;
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) {
    signaled = true;
    return Process::SIGNAL_EXIT_BASE + WTERMSIG(status);
  }
  return -1;
}

void close_pipe(int p[2]) noexcept {
  ::close(p[0]);
  ::close(p[1]);
}

} // namespace

bool Process::open(
    const std::filesystem::path &program,
    const std::vector<std::string> &args,
    const std::filesystem::path &workDir,
    bool redirect_output) noexcept {
  int stdout_p[2], stderr_p[2], error_p[2];

  // the child reports exec failure through error_p, which closes on a successful exec
  if (::pipe(error_p) != 0) {
    spawnError_ = errno;
    return false;
  }
  ::fcntl(error_p[1], F_SETFD, FD_CLOEXEC);

  if (redirect_output && ::pipe(stdout_p) != 0) {
    spawnError_ = errno;
    close_pipe(error_p);
    return false;
  }

  if (redirect_output && ::pipe(stderr_p) != 0) {
    spawnError_ = errno;
    close_pipe(error_p);
    close_pipe(stdout_p);
    return false;
  }

  // everything the child needs is prepared before fork
  std::string exe = program.string();
  std::string dir = workDir.string();
  std::vector<const char *> c_args;
  c_args.push_back(exe.c_str());
  for (auto &arg : args) {
    c_args.push_back(arg.c_str());
  }
  c_args.push_back(nullptr);

  auto pid = fork();

  if (pid < 0) {
    spawnError_ = errno;
    close_pipe(error_p);
    if (redirect_output) { close_pipe(stdout_p); close_pipe(stderr_p); }
    return false;
  }
  else if (pid == 0) {
    if (redirect_output) {
      ::dup2(stdout_p[1], 1);
      ::dup2(stderr_p[1], 2);
      close_pipe(stdout_p);
      close_pipe(stderr_p);
    } else {
      int null_fd = ::open("/dev/null", O_RDWR);
      if (null_fd >= 0) {
        ::dup2(null_fd, 0);
        ::dup2(null_fd, 1);
        ::dup2(null_fd, 2);
        if (null_fd > 2) ::close(null_fd);
      }
    }
    ::close(error_p[0]);

    //Based on http://stackoverflow.com/a/899533/3808293
    int fd_max=static_cast<int>(sysconf(_SC_OPEN_MAX)); // truncation is safe
    for(int fd=3;fd<fd_max;fd++) {
      if (fd != error_p[1])
        close(fd);
    }

    setpgid(0, 0);

    int err = 0;
    if (!dir.empty() && ::chdir(dir.c_str()) != 0) {
      err = errno;
    } else {
      execv(exe.c_str(), (char *const *)&c_args[0]);
      err = errno;
    }

    ssize_t ignored = ::write(error_p[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  ::close(error_p[1]);
  if (redirect_output) {
    ::close(stdout_p[1]);
    ::close(stderr_p[1]);
  }

  int child_err = 0;
  ssize_t n;
  do {
    n = ::read(error_p[0], &child_err, sizeof(child_err));
  } while (n < 0 && errno == EINTR);
  ::close(error_p[0]);

  if (n == sizeof(child_err)) {
    int status;
    ::waitpid(pid, &status, 0);
    if (redirect_output) {
      ::close(stdout_p[0]);
      ::close(stderr_p[0]);
    }
    spawnError_ = child_err;
    return false;
  }

  if (redirect_output) {
    stdoutFd_ = std::make_unique<FileHandle>(stdout_p[0]);
    stderrFd_ = std::make_unique<FileHandle>(stderr_p[0]);
  }

  pid_ = pid;

  return true;
}

void Process::kill() noexcept {
  std::lock_guard lock(close_mutex);
  if(pid_ > 0 && !closed_) {
    ::kill(-pid_, SIGTERM);
  }
}

int Process::wait() noexcept {
  if(pid_ <= 0)
    return -1;

  int status = 0;
  pid_t ret;
  do {
    ret = waitpid(pid_, &status, 0);
  } while (ret == -1 && errno == EINTR);

  closeHandles();

  if (ret == -1)
    return -1;
  return decode_wait_status(status, signaled_);
}

bool Process::wait(int &status, long ms) noexcept {
  if(pid_ <= 0)
    return false;

  int ret;
  int raw_status = 0;
  ::sigset_t sigset;

  //I need to set the signal, because it might be ignore / default, in which case sigwait might not work.

  using _signal_t = void(*)(int);
  static thread_local _signal_t sigchld_handler = SIG_DFL;

  struct signal_interceptor_t {
    static void handler_func(int val)
    {
            if ((sigchld_handler != SIG_DFL) && (sigchld_handler != SIG_IGN))
                sigchld_handler(val);
    }
    signal_interceptor_t()  { sigchld_handler = ::signal(SIGCHLD, &handler_func); }
    ~signal_interceptor_t() { ::signal(SIGCHLD, sigchld_handler); sigchld_handler = SIG_DFL;}

  } signal_interceptor{};

  if (sigemptyset(&sigset) != 0) {
    return false;
  }

  if (sigaddset(&sigset, SIGCHLD) != 0) {
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);

  for (;;) {
    errno = 0;
    ret = ::waitpid(pid_, &raw_status, WNOHANG);
    if (ret == pid_ && (WIFEXITED(raw_status) || WIFSIGNALED(raw_status)))
      break;
    if (ret == -1 && errno != EINTR)
      return false;

    auto remains = std::chrono::duration_cast<std::chrono::nanoseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (remains <= 0)
      return false;

    // wake on SIGCHLD or at most every 50ms, other children may consume the signal
    remains = std::min<long long>(remains, 50000000LL);
    ::timespec ts;
    ts.tv_sec  = remains / 1000000000;
    ts.tv_nsec = remains % 1000000000;
    ::sigtimedwait(&sigset, nullptr, &ts);
  }

  closeHandles();

  status = decode_wait_status(raw_status, signaled_);
  return true;
}

void Process::closeProcessHandle() noexcept {
  if (pid_ > 0) {
    pid_ = -1;
  }
}

} // namespace process_lib
