#include "mnemobox/sandbox/process_isolator.hpp"

#include "mnemobox/common/fs.hpp"
#include "mnemobox/sandbox/runtime_bootstrap.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <grp.h>
#include <mutex>
#include <poll.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifndef CLOSE_RANGE_CLOEXEC
#define CLOSE_RANGE_CLOEXEC (1U << 2)
#endif

namespace mnemobox::sandbox {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kMaxRequestLineBytes = 4 * 1024 * 1024;
constexpr rlim_t kRuntimeThreadHeadroom = 256;
constexpr int kChildScratchFd = 10;
constexpr int kChildFdCount = 5;
constexpr int kPollSliceMs = 50;

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(const int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;
  UniqueFd(UniqueFd &&other) noexcept : fd_(other.release()) {}
  UniqueFd &operator=(UniqueFd &&other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  [[nodiscard]] int get() const { return fd_; }
  [[nodiscard]] bool valid() const { return fd_ >= 0; }

  int release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(const int fd = -1) {
    if (fd_ >= 0) {
      close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

common::Result<Pipe> make_pipe() {
  int fds[2] = {-1, -1};
  if (pipe2(fds, O_CLOEXEC) != 0) {
    return common::Result<Pipe>::failure(std::string("pipe2 failed: ") + std::strerror(errno));
  }
  Pipe pipe;
  pipe.read.reset(fds[0]);
  pipe.write.reset(fds[1]);
  return common::Result<Pipe>::success(std::move(pipe));
}

void set_nonblocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

enum class LaunchStage : int { Descriptors = 1, Session, Limits, Privileges, Exec };

struct LaunchFailure {
  int stage = 0;
  int error = 0;
};

std::string launch_stage_to_string(const int stage) {
  switch (static_cast<LaunchStage>(stage)) {
  case LaunchStage::Descriptors:
    return "descriptor setup";
  case LaunchStage::Session:
    return "session setup";
  case LaunchStage::Limits:
    return "resource limits";
  case LaunchStage::Privileges:
    return "privilege drop";
  case LaunchStage::Exec:
    return "exec";
  }
  return "launch";
}

/// Everything the child needs, built before fork so the child only makes
/// async-signal-safe calls.
struct ChildPlan {
  std::string runtime;
  std::vector<std::string> args;
  std::vector<char *> argv;
  std::vector<std::string> env;
  std::vector<char *> envp;
  rlim_t address_space = RLIM_INFINITY;
  rlim_t cpu_soft = RLIM_INFINITY;
  rlim_t cpu_hard = RLIM_INFINITY;
  int niceness = 0;
  bool isolate_network = false;
  std::optional<uid_t> uid;
  std::optional<gid_t> gid;
  rlim_t max_processes = RLIM_INFINITY;
};

ChildPlan make_plan(const std::filesystem::path &runtime, const PolicyConfig &policy,
                    const IsolatorOptions &options) {
  ChildPlan plan;
  plan.runtime = runtime.string();
  plan.args.push_back(plan.runtime);
  for (auto &flag : runtime_flags(policy)) {
    plan.args.push_back(std::move(flag));
  }
  for (auto &arg : plan.args) {
    plan.argv.push_back(arg.data());
  }
  plan.argv.push_back(nullptr);

  plan.env = {"PATH=/usr/local/bin:/usr/bin:/bin", "LANG=C.UTF-8", "HOME=/nonexistent"};
  for (auto &entry : plan.env) {
    plan.envp.push_back(entry.data());
  }
  plan.envp.push_back(nullptr);

  const auto &limits = policy.limits();
  plan.address_space = static_cast<rlim_t>(limits.max_memory_bytes + options.address_space_overhead_bytes);
  const auto seconds = (limits.max_execution_time.count() + 999) / 1000;
  plan.cpu_soft = static_cast<rlim_t>(seconds + 1);
  plan.cpu_hard = static_cast<rlim_t>(seconds + 2);
  plan.niceness = niceness_for_cpu_percent(limits.max_cpu_percent);

  const auto &isolation = policy.isolation();
  plan.isolate_network = isolation.isolate_network_namespace;
  if (isolation.drop_to_uid.has_value()) {
    plan.uid = static_cast<uid_t>(*isolation.drop_to_uid);
    plan.max_processes = static_cast<rlim_t>(isolation.max_processes) + kRuntimeThreadHeadroom;
  }
  if (isolation.drop_to_gid.has_value()) {
    plan.gid = static_cast<gid_t>(*isolation.drop_to_gid);
  }
  return plan;
}

[[noreturn]] void child_fail(const int status_fd, const LaunchStage stage) {
  const LaunchFailure failure{.stage = static_cast<int>(stage), .error = errno};
  [[maybe_unused]] const ssize_t written = write(status_fd, &failure, sizeof(failure));
  _exit(127);
}

[[noreturn]] void run_child(const ChildPlan &plan, const std::array<int, kChildFdCount> &fds,
                            const int status_fd_in) {
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  signal(SIGPIPE, SIG_DFL);

  const int status_fd = fcntl(status_fd_in, F_DUPFD_CLOEXEC, kChildScratchFd);
  if (status_fd < 0) {
    _exit(127);
  }

  std::array<int, kChildFdCount> moved{};
  for (int i = 0; i < kChildFdCount; ++i) {
    moved[i] = fcntl(fds[i], F_DUPFD, kChildScratchFd);
    if (moved[i] < 0) {
      child_fail(status_fd, LaunchStage::Descriptors);
    }
  }
  for (int i = 0; i < kChildFdCount; ++i) {
    if (dup2(moved[i], i) < 0) {
      child_fail(status_fd, LaunchStage::Descriptors);
    }
  }
  if (syscall(SYS_close_range, kChildFdCount, ~0U, CLOSE_RANGE_CLOEXEC) != 0) {
    for (int fd = kChildFdCount; fd < 1024; ++fd) {
      if (fd != status_fd) {
        close(fd);
      }
    }
  }

  if (setsid() < 0) {
    child_fail(status_fd, LaunchStage::Session);
  }
  prctl(PR_SET_PDEATHSIG, SIGKILL);
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    child_fail(status_fd, LaunchStage::Session);
  }

  const rlimit no_core{.rlim_cur = 0, .rlim_max = 0};
  const rlimit address_space{.rlim_cur = plan.address_space, .rlim_max = plan.address_space};
  const rlimit cpu{.rlim_cur = plan.cpu_soft, .rlim_max = plan.cpu_hard};
  if (setrlimit(RLIMIT_CORE, &no_core) != 0 || setrlimit(RLIMIT_AS, &address_space) != 0 ||
      setrlimit(RLIMIT_CPU, &cpu) != 0) {
    child_fail(status_fd, LaunchStage::Limits);
  }
  if (setpriority(PRIO_PROCESS, 0, plan.niceness) != 0) {
    child_fail(status_fd, LaunchStage::Limits);
  }

  if (plan.isolate_network) {
    // Best-effort: hosts without CAP_SYS_ADMIN refuse new namespaces.
    [[maybe_unused]] const int unshared = unshare(CLONE_NEWNET);
  }

  if (plan.gid.has_value()) {
    if (setgroups(0, nullptr) != 0 || setgid(*plan.gid) != 0) {
      child_fail(status_fd, LaunchStage::Privileges);
    }
  }
  if (plan.uid.has_value()) {
    const rlimit nproc{.rlim_cur = plan.max_processes, .rlim_max = plan.max_processes};
    if (setrlimit(RLIMIT_NPROC, &nproc) != 0 || setuid(*plan.uid) != 0) {
      child_fail(status_fd, LaunchStage::Privileges);
    }
    if (*plan.uid != 0 && setuid(0) == 0) {
      errno = EPERM;
      child_fail(status_fd, LaunchStage::Privileges);
    }
  }

  execve(plan.runtime.c_str(), plan.argv.data(), plan.envp.data());
  child_fail(status_fd, LaunchStage::Exec);
}

/// Kills the whole process group and reaps the child unless already reaped.
class ChildGuard {
public:
  explicit ChildGuard(const pid_t pid) : pid_(pid) {}
  ~ChildGuard() {
    if (pid_ > 0) {
      kill_group();
      int status = 0;
      waitpid(pid_, &status, 0);
    }
  }

  ChildGuard(const ChildGuard &) = delete;
  ChildGuard &operator=(const ChildGuard &) = delete;

  void kill_group() const {
    if (pid_ > 0) {
      kill(-pid_, SIGKILL);
      kill(pid_, SIGKILL);
    }
  }

  /// Non-blocking reap; true once the child has exited.
  bool try_reap(int &status) {
    if (pid_ <= 0) {
      return true;
    }
    const pid_t done = waitpid(pid_, &status, WNOHANG);
    if (done == pid_ || (done < 0 && errno == ECHILD)) {
      kill(-pid_, SIGKILL);
      pid_ = -1;
      return true;
    }
    return false;
  }

  void reap(int &status) {
    if (pid_ <= 0) {
      return;
    }
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    kill(-pid_, SIGKILL);
    pid_ = -1;
  }

private:
  pid_t pid_;
};

void append_capped(std::string &out, const char *data, const std::size_t size,
                   const std::size_t limit) {
  const std::size_t remaining = limit > out.size() ? limit - out.size() : 0;
  out.append(data, std::min(remaining, size));
}

bool reports_memory_exhaustion(const std::string &stderr_text) {
  return stderr_text.find("heap out of memory") != std::string::npos ||
         stderr_text.find("Fatal process out of memory") != std::string::npos ||
         stderr_text.find("std::bad_alloc") != std::string::npos ||
         stderr_text.find("Failed to reserve virtual memory") != std::string::npos;
}

RawOutcome launch_failed(std::string message, const Clock::time_point started) {
  RawOutcome outcome;
  outcome.kind = RawOutcome::Kind::LaunchFailed;
  outcome.message = std::move(message);
  outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
  return outcome;
}

std::once_flag g_sigpipe_once;

} // namespace

int niceness_for_cpu_percent(const std::uint32_t percent) {
  const std::uint32_t clamped = std::clamp<std::uint32_t>(percent, 1, 100);
  return static_cast<int>(((100 - clamped) * 19) / 100);
}

bool runtime_available(const std::string &runtime_path) {
  return common::find_executable(runtime_path).has_value();
}

NodeProcessIsolator::NodeProcessIsolator(IsolatorOptions options) : options_(std::move(options)) {
  if (!options_.http_client) {
    options_.http_client = std::make_shared<CurlHttpClient>();
  }
  if (!options_.resolver) {
    options_.resolver = system_resolver();
  }
}

RawOutcome NodeProcessIsolator::run(const std::string &code, const ExecutionContext &context,
                                    const PolicyConfig &policy,
                                    const Clock::time_point deadline) {
  const auto started = Clock::now();

  // Writes to a runtime that already exited must surface as EPIPE.
  std::call_once(g_sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

  const auto runtime = common::find_executable(options_.runtime_path);
  if (!runtime.has_value()) {
    return launch_failed("runtime not found: " + options_.runtime_path, started);
  }

  const ChildPlan plan = make_plan(*runtime, policy, options_);
  const std::string program = build_runtime_program(code, context);
  CapabilityBroker broker(policy, options_.http_client, options_.memory_query, options_.resolver);

  std::array<Pipe, kChildFdCount> pipes;
  for (auto &pipe : pipes) {
    auto created = make_pipe();
    if (!created.ok()) {
      return launch_failed(created.error(), started);
    }
    pipe = std::move(created.value());
  }
  auto status_pipe = make_pipe();
  if (!status_pipe.ok()) {
    return launch_failed(status_pipe.error(), started);
  }

  Pipe &stdin_pipe = pipes[0];
  Pipe &stdout_pipe = pipes[1];
  Pipe &stderr_pipe = pipes[2];
  Pipe &request_pipe = pipes[kRuntimeRequestFd];
  Pipe &reply_pipe = pipes[kRuntimeReplyFd];

  const std::array<int, kChildFdCount> child_fds = {
      stdin_pipe.read.get(), stdout_pipe.write.get(), stderr_pipe.write.get(),
      request_pipe.write.get(), reply_pipe.read.get()};

  const pid_t pid = fork();
  if (pid < 0) {
    return launch_failed(std::string("fork failed: ") + std::strerror(errno), started);
  }
  if (pid == 0) {
    run_child(plan, child_fds, status_pipe.value().write.get());
  }

  ChildGuard child(pid);
  stdin_pipe.read.reset();
  stdout_pipe.write.reset();
  stderr_pipe.write.reset();
  request_pipe.write.reset();
  reply_pipe.read.reset();
  status_pipe.value().write.reset();

  LaunchFailure failure;
  ssize_t status_bytes = -1;
  do {
    status_bytes = read(status_pipe.value().read.get(), &failure, sizeof(failure));
  } while (status_bytes < 0 && errno == EINTR);
  if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
    int status = 0;
    child.reap(status);
    return launch_failed("runtime launch failed during " + launch_stage_to_string(failure.stage) +
                             ": " + std::strerror(failure.error),
                         started);
  }

  set_nonblocking(stdin_pipe.write.get());
  set_nonblocking(stdout_pipe.read.get());
  set_nonblocking(stderr_pipe.read.get());
  set_nonblocking(request_pipe.read.get());
  set_nonblocking(reply_pipe.write.get());

  std::string pending_stdin = program;
  std::string pending_reply;
  std::string request_buffer;
  std::string captured_stdout;
  std::string captured_stderr;
  std::optional<Violation> violation;
  std::optional<RuntimeReport> report;
  bool timed_out = false;
  bool reaped = false;
  int status = 0;

  std::array<char, 8192> buffer{};
  const auto drain = [&](UniqueFd &fd, const auto &sink) {
    while (fd.valid()) {
      const ssize_t bytes = read(fd.get(), buffer.data(), buffer.size());
      if (bytes > 0) {
        sink(buffer.data(), static_cast<std::size_t>(bytes));
        continue;
      }
      if (bytes < 0 && errno == EINTR) {
        continue;
      }
      if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        break;
      }
      fd.reset();
    }
  };
  const auto stdout_sink = [&](const char *data, const std::size_t size) {
    append_capped(captured_stdout, data, size, options_.max_output_bytes);
  };
  const auto stderr_sink = [&](const char *data, const std::size_t size) {
    append_capped(captured_stderr, data, size, options_.max_output_bytes);
  };
  const auto request_sink = [&](const char *data, const std::size_t size) {
    request_buffer.append(data, size);
    std::size_t newline = 0;
    while (!violation.has_value() &&
           (newline = request_buffer.find('\n')) != std::string::npos) {
      const std::string line = request_buffer.substr(0, newline);
      request_buffer.erase(0, newline + 1);
      const auto time_left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - Clock::now());
      auto step = broker.handle(line, time_left);
      if (step.violation.has_value()) {
        violation = std::move(step.violation);
      } else if (step.report.has_value()) {
        report = std::move(step.report);
      } else if (step.reply.has_value()) {
        pending_reply += *step.reply;
        pending_reply.push_back('\n');
      }
    }
    if (!violation.has_value() && request_buffer.size() > kMaxRequestLineBytes) {
      violation = Violation{.type = ViolationType::ResourceExhaustion,
                            .reason = "Runtime request exceeds " +
                                      std::to_string(kMaxRequestLineBytes) + " bytes"};
    }
  };
  const auto flush = [](UniqueFd &fd, std::string &pending) {
    while (fd.valid() && !pending.empty()) {
      const ssize_t written = write(fd.get(), pending.data(), pending.size());
      if (written > 0) {
        pending.erase(0, static_cast<std::size_t>(written));
        continue;
      }
      if (written < 0 && errno == EINTR) {
        continue;
      }
      if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return;
      }
      fd.reset();
      pending.clear();
    }
  };

  while (!reaped) {
    const auto now = Clock::now();
    if (now >= deadline) {
      timed_out = true;
      child.kill_group();
      break;
    }

    std::vector<pollfd> pfds;
    const auto watch = [&pfds](const UniqueFd &fd, const short events) {
      if (fd.valid()) {
        pfds.push_back(pollfd{.fd = fd.get(), .events = events, .revents = 0});
      }
    };
    watch(stdout_pipe.read, POLLIN);
    watch(stderr_pipe.read, POLLIN);
    watch(request_pipe.read, POLLIN);
    if (!pending_stdin.empty()) {
      watch(stdin_pipe.write, POLLOUT);
    }
    if (!pending_reply.empty()) {
      watch(reply_pipe.write, POLLOUT);
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    const int slice = static_cast<int>(std::clamp<long long>(remaining, 1, kPollSliceMs));
    if (pfds.empty()) {
      (void)poll(nullptr, 0, slice);
    } else {
      (void)poll(pfds.data(), pfds.size(), slice);
    }

    flush(stdin_pipe.write, pending_stdin);
    if (pending_stdin.empty()) {
      stdin_pipe.write.reset();
    }
    drain(stdout_pipe.read, stdout_sink);
    drain(stderr_pipe.read, stderr_sink);
    drain(request_pipe.read, request_sink);
    if (violation.has_value()) {
      child.kill_group();
      break;
    }
    flush(reply_pipe.write, pending_reply);

    if (child.try_reap(status)) {
      reaped = true;
      drain(stdout_pipe.read, stdout_sink);
      drain(stderr_pipe.read, stderr_sink);
      drain(request_pipe.read, request_sink);
    }
  }

  if (!reaped) {
    child.reap(status);
  }

  RawOutcome outcome;
  outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
  outcome.captured_stdout = std::move(captured_stdout);
  outcome.captured_stderr = std::move(captured_stderr);

  if (violation.has_value()) {
    outcome.kind = RawOutcome::Kind::Violated;
    outcome.message = violation->reason;
    outcome.violation = std::move(violation);
    return outcome;
  }
  if (timed_out) {
    outcome.kind = RawOutcome::Kind::TimedOut;
    outcome.message = "execution exceeded its deadline";
    return outcome;
  }
  if (report.has_value()) {
    outcome.kind = report->ok ? RawOutcome::Kind::Completed : RawOutcome::Kind::Failed;
    outcome.output = std::move(report->output);
    outcome.error_type = report->error_type;
    outcome.message = std::move(report->message);
    return outcome;
  }

  if (reports_memory_exhaustion(outcome.captured_stderr)) {
    outcome.kind = RawOutcome::Kind::Violated;
    outcome.violation = Violation{.type = ViolationType::ResourceExhaustion,
                                  .reason = "Memory limit exceeded"};
    outcome.message = outcome.violation->reason;
    return outcome;
  }
  if (WIFSIGNALED(status) && (WTERMSIG(status) == SIGXCPU || WTERMSIG(status) == SIGKILL)) {
    outcome.kind = RawOutcome::Kind::Violated;
    outcome.violation = Violation{.type = ViolationType::ResourceExhaustion,
                                  .reason = "CPU time limit exceeded"};
    outcome.message = outcome.violation->reason;
    return outcome;
  }

  outcome.kind = RawOutcome::Kind::Failed;
  outcome.error_type = ErrorType::Runtime;
  if (WIFSIGNALED(status)) {
    outcome.message = "runtime terminated by signal " + std::to_string(WTERMSIG(status));
  } else {
    outcome.message = "runtime exited with status " + std::to_string(WEXITSTATUS(status)) +
                      " without reporting a result";
  }
  return outcome;
}

} // namespace mnemobox::sandbox
