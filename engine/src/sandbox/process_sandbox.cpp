#include "sandbox/process_sandbox.h"

#include <fcntl.h>
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/landlock.h>
#include <linux/seccomp.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include "capture/envelope.h"
#include "capture/output_buffer.h"
#include "capture/result_json.h"
#include "logging/trace.h"
#include "sandbox/harness.h"

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

namespace analysis_sandbox {

namespace {

using Clock = std::chrono::steady_clock;

// Child setup stages reported over the status pipe
enum ChildStage : int32_t {
  kStageNetworkDegraded = 1,
  kStageFilesystemDegraded = 2,
  kStageProcessDegraded = 3,
  kStageNetwork = 10,
  kStageFilesystem = 11,
  kStageLimits = 12,
  kStageSetup = 13,
  kStageExec = 14,
  kStageProcess = 15,
};

struct ChildReport {
  int32_t stage;
  int32_t error;
};

constexpr int kChildFdBase = 10;
constexpr int kExecFailedStatus = 127;

/**
 * Owned file descriptor.
 */
class Fd {
 public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { Reset(); }

  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;
  Fd(Fd&& other) noexcept : fd_(other.Release()) {}
  Fd& operator=(Fd&& other) noexcept {
    if (this != &other) {
      Reset(other.Release());
    }
    return *this;
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  int Release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_ = -1;
};

std::string ErrnoMessage(int err) {
  return std::error_code(err, std::generic_category()).message();
}

bool MakePipe(Fd& read_end, Fd& write_end, std::string* error_out) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    if (error_out) *error_out = "pipe: " + ErrnoMessage(errno);
    return false;
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

bool SetNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

/**
 * Private per-run directory, removed with everything in it on destruction.
 */
class ScratchDir {
 public:
  ScratchDir() = default;
  ~ScratchDir() {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
      if (ec) {
        Tracer::LogWarning("scratch_cleanup_failed", ec.message(), {{"path", path_}});
      }
    }
  }

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  bool Create(const std::string& root, std::string* error_out) {
    std::string base = root;
    if (base.empty()) {
      const char* tmp = std::getenv("TMPDIR");
      base = (tmp && *tmp) ? tmp : "/tmp";
    }
    std::string templ = base + "/analysis-sandbox-XXXXXX";
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
      if (error_out) *error_out = fmt::format("mkdtemp in {}: {}", base, ErrnoMessage(errno));
      return false;
    }
    path_ = buffer.data();
    return true;
  }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

/**
 * Everything the child needs, prepared before fork so the child allocates
 * nothing between fork and exec.
 */
struct ChildPlan {
  pid_t parent_pid = 0;
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  int result_fd = -1;
  int status_fd = -1;

  std::string interpreter;
  std::vector<std::string> arg_storage;
  std::vector<std::string> env_storage;
  std::vector<char*> argv;
  std::vector<char*> envp;

  std::string scratch;
  std::string uid_map;
  std::string gid_map;

  rlim_t memory_bytes = 0;
  rlim_t cpu_seconds = 0;
  rlim_t file_bytes = 0;
  rlim_t open_files = 0;

  bool isolate_network = false;
  bool require_network = false;
  bool restrict_filesystem = false;
  bool require_filesystem = false;
  bool restrict_process = false;
  bool require_process = false;
  bool block_spawn = false;

  void Finalize() {
    argv.clear();
    for (auto& arg : arg_storage) argv.push_back(arg.data());
    argv.push_back(nullptr);
    envp.clear();
    for (auto& env : env_storage) envp.push_back(env.data());
    envp.push_back(nullptr);
  }
};

// --- Child side: async-signal-safe calls only ---

void Report(int fd, int32_t stage, int32_t error) {
  ChildReport report{stage, error};
  ssize_t ignored = ::write(fd, &report, sizeof(report));
  (void)ignored;
}

[[noreturn]] void Fail(const ChildPlan& plan, int32_t stage, int error) {
  Report(plan.status_fd, stage, error);
  ::_exit(kExecFailedStatus);
}

bool WriteProcFile(const char* path, const std::string& content) {
  int fd = ::open(path, O_WRONLY | O_CLOEXEC);
  if (fd < 0) return false;
  bool ok = ::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size());
  ::close(fd);
  return ok;
}

bool IsolateNetwork(const ChildPlan& plan, int* error) {
  if (::unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) {
    // Identity mapping keeps getuid() stable inside the namespace; an
    // unmapped id still leaves the network isolated.
    if (WriteProcFile("/proc/self/setgroups", "deny")) {
      WriteProcFile("/proc/self/gid_map", plan.gid_map);
    }
    WriteProcFile("/proc/self/uid_map", plan.uid_map);
    return true;
  }
  *error = errno;
  // Privileged hosts without user namespaces
  if (::unshare(CLONE_NEWNET) == 0) {
    return true;
  }
  return false;
}

int LandlockCreateRuleset(const landlock_ruleset_attr* attr, size_t size, uint32_t flags) {
  return static_cast<int>(::syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

int LandlockAddRule(int ruleset_fd, landlock_rule_type type, const void* attr, uint32_t flags) {
  return static_cast<int>(::syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags));
}

int LandlockRestrictSelf(int ruleset_fd, uint32_t flags) {
  return static_cast<int>(::syscall(__NR_landlock_restrict_self, ruleset_fd, flags));
}

bool AllowBeneath(int ruleset_fd, const char* path, uint64_t access) {
  int fd = ::open(path, O_PATH | O_CLOEXEC);
  if (fd < 0) return false;
  landlock_path_beneath_attr beneath{};
  beneath.allowed_access = access;
  beneath.parent_fd = fd;
  int rc = LandlockAddRule(ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &beneath, 0);
  ::close(fd);
  return rc == 0;
}

// Deny every write, create and remove outside the scratch directory
bool RestrictFilesystem(const ChildPlan& plan, int* error) {
  int abi = LandlockCreateRuleset(nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
  if (abi < 1) {
    *error = errno;
    return false;
  }

  uint64_t write_access = LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_REMOVE_DIR |
                          LANDLOCK_ACCESS_FS_REMOVE_FILE | LANDLOCK_ACCESS_FS_MAKE_CHAR |
                          LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG |
                          LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO |
                          LANDLOCK_ACCESS_FS_MAKE_BLOCK | LANDLOCK_ACCESS_FS_MAKE_SYM;
#ifdef LANDLOCK_ACCESS_FS_REFER
  if (abi >= 2) {
    write_access |= LANDLOCK_ACCESS_FS_REFER;
  }
#endif

  landlock_ruleset_attr attr{};
  attr.handled_access_fs = write_access;
  int ruleset_fd = LandlockCreateRuleset(&attr, sizeof(attr), 0);
  if (ruleset_fd < 0) {
    *error = errno;
    return false;
  }

  bool ok = AllowBeneath(ruleset_fd, plan.scratch.c_str(), write_access);
  if (!ok) {
    *error = errno;
  }
  // Best effort: some libraries open /dev/null for writing
  if (ok) {
    AllowBeneath(ruleset_fd, "/dev/null", LANDLOCK_ACCESS_FS_WRITE_FILE);
  }
  if (ok && LandlockRestrictSelf(ruleset_fd, 0) != 0) {
    *error = errno;
    ok = false;
  }
  ::close(ruleset_fd);
  return ok;
}

#if defined(__x86_64__)
constexpr uint32_t kAuditArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
#else
constexpr uint32_t kAuditArch = 0;
#endif

#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
constexpr uint32_t kLowWord = 0;
constexpr uint32_t kHighWord = 4;
#else
constexpr uint32_t kLowWord = 4;
constexpr uint32_t kHighWord = 0;
#endif

constexpr uint32_t kDenyPermission = SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA);
constexpr uint32_t kDenyNoSys = SECCOMP_RET_ERRNO | (ENOSYS & SECCOMP_RET_DATA);

uint32_t ArgOffset(int index, uint32_t word) {
  return static_cast<uint32_t>(offsetof(seccomp_data, args) + index * sizeof(uint64_t) + word);
}

/**
 * Fixed-capacity BPF program, filled in the child without allocating.
 * Each rule is a self-contained block that reloads the syscall number and
 * either returns a denial or falls through to the next block.
 */
class SyscallFilter {
 public:
  void Stmt(uint16_t code, uint32_t k) { Push(code, 0, 0, k); }
  void Jump(uint16_t code, uint32_t k, uint8_t jt, uint8_t jf) { Push(code, jt, jf, k); }

  void LoadNr() { Stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(seccomp_data, nr)); }
  void LoadArg(int index, uint32_t word) { Stmt(BPF_LD | BPF_W | BPF_ABS, ArgOffset(index, word)); }

  void Deny(long nr, uint32_t action) {
    LoadNr();
    Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 1);
    Stmt(BPF_RET | BPF_K, action);
  }

  // Signals may only target the worker itself: pid, 0 (own group) or -pid
  void DenySignalOutside(long nr, uint32_t self) {
    LoadNr();
    Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 5);
    LoadArg(0, kLowWord);
    Jump(BPF_JMP | BPF_JEQ | BPF_K, self, 3, 0);
    Jump(BPF_JMP | BPF_JEQ | BPF_K, 0, 2, 0);
    Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(-static_cast<int32_t>(self)), 1, 0);
    Stmt(BPF_RET | BPF_K, kDenyPermission);
  }

  // The first argument is a thread group id that must be the worker's
  void DenyThreadGroupOutside(long nr, uint32_t self) {
    LoadNr();
    Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 3);
    LoadArg(0, kLowWord);
    Jump(BPF_JMP | BPF_JEQ | BPF_K, self, 1, 0);
    Stmt(BPF_RET | BPF_K, kDenyPermission);
  }

  // clone is allowed for threads only
  void DenyCloneWithoutThread(long nr) {
    LoadNr();
    Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 3);
    LoadArg(0, kLowWord);
    Jump(BPF_JMP | BPF_JSET | BPF_K, CLONE_THREAD, 1, 0);
    Stmt(BPF_RET | BPF_K, kDenyPermission);
  }

  // Pins execve to one filename pointer, the one the worker execs with
  void DenyExecExcept(long nr, const void* filename) {
    const uint64_t address = reinterpret_cast<uintptr_t>(filename);
    LoadNr();
    Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 5);
    LoadArg(0, kLowWord);
    Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(address), 0, 2);
    LoadArg(0, kHighWord);
    Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(address >> 32), 1, 0);
    Stmt(BPF_RET | BPF_K, kDenyPermission);
  }

  bool Install(int* error) {
    if (overflow_) {
      *error = E2BIG;
      return false;
    }
    sock_fprog program{};
    program.len = size_;
    program.filter = ops_;
    if (::prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &program, 0, 0) != 0) {
      *error = errno;
      return false;
    }
    return true;
  }

 private:
  static constexpr unsigned short kCapacity = 128;

  void Push(uint16_t code, uint8_t jt, uint8_t jf, uint32_t k) {
    if (size_ == kCapacity) {
      overflow_ = true;
      return;
    }
    sock_filter& op = ops_[size_++];
    op.code = code;
    op.jt = jt;
    op.jf = jf;
    op.k = k;
  }

  sock_filter ops_[kCapacity];
  unsigned short size_ = 0;
  bool overflow_ = false;
};

// Confine signals and tracing to the worker, and optionally forbid new processes
bool RestrictProcess(const ChildPlan& plan, int* error) {
  if (kAuditArch == 0) {
    *error = ENOSYS;
    return false;
  }
  const uint32_t self = static_cast<uint32_t>(::getpid());

  SyscallFilter filter;
  filter.Stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(seccomp_data, arch));
  filter.Jump(BPF_JMP | BPF_JEQ | BPF_K, kAuditArch, 1, 0);
  filter.Stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL);
#ifdef __x86_64__
  // x32 syscall numbers would bypass every rule below
  filter.LoadNr();
  filter.Jump(BPF_JMP | BPF_JGE | BPF_K, 0x40000000, 0, 1);
  filter.Stmt(BPF_RET | BPF_K, kDenyNoSys);
#endif

  filter.DenySignalOutside(__NR_kill, self);
  filter.DenyThreadGroupOutside(__NR_tgkill, self);
  filter.DenyThreadGroupOutside(__NR_rt_sigqueueinfo, self);
  filter.DenyThreadGroupOutside(__NR_rt_tgsigqueueinfo, self);
  filter.Deny(__NR_tkill, kDenyPermission);
  filter.Deny(__NR_ptrace, kDenyPermission);
  filter.Deny(__NR_process_vm_readv, kDenyPermission);
  filter.Deny(__NR_process_vm_writev, kDenyPermission);
#ifdef __NR_pidfd_open
  filter.Deny(__NR_pidfd_open, kDenyPermission);
#endif
#ifdef __NR_pidfd_send_signal
  filter.Deny(__NR_pidfd_send_signal, kDenyPermission);
#endif
#ifdef __NR_pidfd_getfd
  filter.Deny(__NR_pidfd_getfd, kDenyPermission);
#endif

  if (plan.block_spawn) {
#ifdef __NR_fork
    filter.Deny(__NR_fork, kDenyPermission);
#endif
#ifdef __NR_vfork
    filter.Deny(__NR_vfork, kDenyPermission);
#endif
    filter.DenyCloneWithoutThread(__NR_clone);
#ifdef __NR_clone3
    // Flags live behind a pointer; libc falls back to clone on ENOSYS
    filter.Deny(__NR_clone3, kDenyNoSys);
#endif
#ifdef __NR_execveat
    filter.Deny(__NR_execveat, kDenyPermission);
#endif
    filter.DenyExecExcept(__NR_execve, plan.interpreter.c_str());
  }

  filter.Stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW);
  return filter.Install(error);
}

bool SetLimit(int resource, rlim_t value) {
  struct rlimit current;
  if (::getrlimit(resource, &current) != 0) return false;
  rlim_t capped = value;
  if (current.rlim_max != RLIM_INFINITY && capped > current.rlim_max) {
    capped = current.rlim_max;
  }
  struct rlimit limit{capped, capped};
  return ::setrlimit(resource, &limit) == 0;
}

bool ApplyLimits(const ChildPlan& plan) {
  return SetLimit(RLIMIT_AS, plan.memory_bytes) && SetLimit(RLIMIT_CPU, plan.cpu_seconds) &&
         SetLimit(RLIMIT_FSIZE, plan.file_bytes) && SetLimit(RLIMIT_NOFILE, plan.open_files) &&
         SetLimit(RLIMIT_CORE, 0) && (!plan.block_spawn || SetLimit(RLIMIT_NPROC, 0));
}

// Move an fd above the standard range so dup2 into 0-3 cannot clobber it
int Lift(const ChildPlan& plan, int fd) {
  int lifted = ::fcntl(fd, F_DUPFD_CLOEXEC, kChildFdBase);
  if (lifted < 0) Fail(plan, kStageSetup, errno);
  return lifted;
}

[[noreturn]] void RunChild(ChildPlan& plan) {
  ::setpgid(0, 0);

  ::prctl(PR_SET_PDEATHSIG, SIGKILL);
  if (::getppid() != plan.parent_pid) {
    ::_exit(kExecFailedStatus);
  }

  sigset_t empty;
  sigemptyset(&empty);
  ::sigprocmask(SIG_SETMASK, &empty, nullptr);
  ::signal(SIGPIPE, SIG_DFL);

  plan.status_fd = Lift(plan, plan.status_fd);
  const int in = Lift(plan, plan.stdin_fd);
  const int out = Lift(plan, plan.stdout_fd);
  const int err = Lift(plan, plan.stderr_fd);
  const int res = Lift(plan, plan.result_fd);
  if (::dup2(in, STDIN_FILENO) < 0 || ::dup2(out, STDOUT_FILENO) < 0 ||
      ::dup2(err, STDERR_FILENO) < 0 || ::dup2(res, kResultFd) < 0) {
    Fail(plan, kStageSetup, errno);
  }

  // Nothing inherited beyond the four channels survives exec
#ifdef __NR_close_range
  if (::syscall(__NR_close_range, kResultFd + 1, ~0U, 4 /* CLOSE_RANGE_CLOEXEC */) != 0)
#endif
  {
    for (int fd = kResultFd + 1; fd < 1024; ++fd) {
      if (fd != plan.status_fd) ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
  }

  if (::chdir(plan.scratch.c_str()) != 0) {
    Fail(plan, kStageSetup, errno);
  }

  if (plan.isolate_network) {
    int error = 0;
    if (!IsolateNetwork(plan, &error)) {
      if (plan.require_network) Fail(plan, kStageNetwork, error);
      Report(plan.status_fd, kStageNetworkDegraded, error);
    }
  }

  if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    Fail(plan, kStageSetup, errno);
  }

  if (plan.restrict_filesystem) {
    int error = 0;
    if (!RestrictFilesystem(plan, &error)) {
      if (plan.require_filesystem) Fail(plan, kStageFilesystem, error);
      Report(plan.status_fd, kStageFilesystemDegraded, error);
    }
  }

  if (!ApplyLimits(plan)) {
    Fail(plan, kStageLimits, errno);
  }

  // Last step before exec: the filter pins execve to the interpreter path
  if (plan.restrict_process) {
    int error = 0;
    if (!RestrictProcess(plan, &error)) {
      if (plan.require_process) Fail(plan, kStageProcess, error);
      Report(plan.status_fd, kStageProcessDegraded, error);
    }
  }

  ::execve(plan.interpreter.c_str(), plan.argv.data(), plan.envp.data());
  Fail(plan, kStageExec, errno);
}

// --- Parent side ---

std::vector<ChildReport> ReadReports(int fd) {
  std::vector<ChildReport> reports;
  std::string bytes;
  char buffer[256];
  while (true) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      bytes.append(buffer, static_cast<size_t>(n));
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      break;
    }
  }
  for (size_t off = 0; off + sizeof(ChildReport) <= bytes.size(); off += sizeof(ChildReport)) {
    ChildReport report;
    std::memcpy(&report, bytes.data() + off, sizeof(report));
    reports.push_back(report);
  }
  return reports;
}

// Feature name for a best-effort stage, nullptr for a fatal one
const char* DegradedFeature(int32_t stage) {
  switch (stage) {
    case kStageNetworkDegraded: return "network";
    case kStageFilesystemDegraded: return "filesystem";
    case kStageProcessDegraded: return "process";
    default: return nullptr;
  }
}

std::string DescribeFailure(const ChildReport& report, const std::string& interpreter) {
  const std::string reason = ErrnoMessage(report.error);
  switch (report.stage) {
    case kStageNetwork: return "Network isolation unavailable: " + reason;
    case kStageFilesystem: return "Filesystem isolation unavailable: " + reason;
    case kStageProcess: return "Process isolation unavailable: " + reason;
    case kStageLimits: return "Failed to apply resource limits: " + reason;
    case kStageExec: return fmt::format("Failed to start interpreter {}: {}", interpreter, reason);
    default: return "Failed to prepare worker: " + reason;
  }
}

// Resident set size in KiB, or -1 when unavailable
long ReadRssKb(pid_t pid) {
  std::ifstream status("/proc/" + std::to_string(pid) + "/status");
  std::string line;
  while (std::getline(status, line)) {
    if (line.compare(0, 6, "VmRSS:") == 0) {
      std::istringstream fields(line.substr(6));
      long kb = -1;
      fields >> kb;
      return kb;
    }
  }
  return -1;
}

// Read whatever is available. Returns false once the writer side is closed.
template <typename SinkFn>
bool Drain(int fd, SinkFn&& sink) {
  char buffer[65536];
  while (true) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      sink(buffer, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    return false;
  }
}

void KillGroup(pid_t pid) {
  if (::kill(-pid, SIGKILL) != 0 && errno == ESRCH) {
    ::kill(pid, SIGKILL);
  }
}

void Reap(pid_t pid, int* status) {
  while (::waitpid(pid, status, 0) < 0 && errno == EINTR) {
  }
}

enum class StopReason { kNone, kTimeout, kCancelled, kMemory, kResultOverflow, kPollFailure };

ExecutionError MakeError(ErrorKind kind, std::string message) {
  ExecutionError error;
  error.kind = kind;
  error.message = std::move(message);
  return error;
}

// Error for a worker that ended without a usable envelope
ExecutionError ClassifyExit(int wait_status) {
  if (WIFSIGNALED(wait_status)) {
    const int sig = WTERMSIG(wait_status);
    switch (sig) {
      case SIGXCPU:
        return MakeError(ErrorKind::kTimeout, "CPU time limit exceeded");
      case SIGXFSZ:
        return MakeError(ErrorKind::kResourceExceeded, "File size limit exceeded");
      case SIGKILL:
      case SIGSEGV:
      case SIGBUS:
      case SIGABRT:
        return MakeError(ErrorKind::kResourceExceeded,
                         fmt::format("Worker terminated by signal {} (likely memory exhaustion)", sig));
      default:
        return MakeError(ErrorKind::kInternalError, fmt::format("Worker terminated by signal {}", sig));
    }
  }
  const int code = WIFEXITED(wait_status) ? WEXITSTATUS(wait_status) : -1;
  if (code == kExecFailedStatus) {
    return MakeError(ErrorKind::kInternalError, "Worker failed to start the interpreter");
  }
  return MakeError(ErrorKind::kInternalError,
                   fmt::format("Worker exited with status {} without a result", code));
}

double SecondsSince(Clock::time_point start) {
  return std::chrono::duration<double>(Clock::now() - start).count();
}

ExecutionResult InternalFailure(const std::string& message, Clock::time_point start) {
  Tracer::LogError("internal_error", message, {{"runner", "process"}});
  return FailureResult(ErrorKind::kInternalError, message, SecondsSince(start));
}

}  // namespace

ProcessSandbox::ProcessSandbox(const Policy& policy, SandboxOptions options)
    : policy_(policy), options_(std::move(options)) {}

ExecutionResult ProcessSandbox::Execute(const std::string& sanitized_code,
                                        const ExecutionContext& context,
                                        const ExecutionLimits& limits,
                                        const CancellationToken* cancel,
                                        const OutputCallback& on_output) {
  const auto start = Clock::now();
  const auto deadline = start + std::chrono::seconds(limits.timeout_seconds);

  if (cancel && cancel->IsCancelled()) {
    return FailureResult(ErrorKind::kCancelled, "Execution cancelled before start");
  }
  if (::access(options_.interpreter.c_str(), X_OK) != 0) {
    return InternalFailure("Python interpreter not found: " + options_.interpreter, start);
  }

  const std::string request =
      BuildHarnessRequest(sanitized_code, context, policy_)
          .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  ScratchDir scratch;
  std::string error;
  if (!scratch.Create(options_.scratch_root, &error)) {
    return InternalFailure("Failed to create scratch directory: " + error, start);
  }

  // Channels: stdin is a socket so writes to a dead worker raise no SIGPIPE
  Fd stdin_parent, stdin_child, stdout_read, stdout_write, stderr_read, stderr_write;
  Fd result_read, result_write, status_read, status_write;
  int sv[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
    return InternalFailure("socketpair: " + ErrnoMessage(errno), start);
  }
  stdin_parent.Reset(sv[0]);
  stdin_child.Reset(sv[1]);
  if (!MakePipe(stdout_read, stdout_write, &error) ||
      !MakePipe(stderr_read, stderr_write, &error) ||
      !MakePipe(result_read, result_write, &error) ||
      !MakePipe(status_read, status_write, &error)) {
    return InternalFailure("Failed to create worker pipes: " + error, start);
  }

  ChildPlan plan;
  plan.parent_pid = ::getpid();
  plan.stdin_fd = stdin_child.get();
  plan.stdout_fd = stdout_write.get();
  plan.stderr_fd = stderr_write.get();
  plan.result_fd = result_write.get();
  plan.status_fd = status_write.get();
  plan.interpreter = options_.interpreter;
  plan.arg_storage = {options_.interpreter, "-I", "-B", "-u", "-c", HarnessSource()};
  plan.env_storage = {
      "PATH=/usr/local/bin:/usr/bin:/bin",
      "LANG=C.UTF-8",
      "HOME=" + scratch.path(),
      "TMPDIR=" + scratch.path(),
      "MPLCONFIGDIR=" + scratch.path(),
      "MPLBACKEND=Agg",
      "OMP_NUM_THREADS=1",
      "OPENBLAS_NUM_THREADS=1",
      "MKL_NUM_THREADS=1",
      "NUMEXPR_NUM_THREADS=1",
  };
  plan.scratch = scratch.path();
  plan.uid_map = fmt::format("{0} {0} 1\n", ::geteuid());
  plan.gid_map = fmt::format("{0} {0} 1\n", ::getegid());
  plan.memory_bytes = static_cast<rlim_t>(limits.max_memory_mb) * 1024 * 1024;
  plan.cpu_seconds = static_cast<rlim_t>(limits.timeout_seconds) + 1;
  plan.file_bytes = static_cast<rlim_t>(options_.scratch_file_limit_mb) * 1024 * 1024;
  plan.open_files = static_cast<rlim_t>(options_.max_open_files);
  plan.isolate_network = options_.isolate_network;
  plan.require_network = options_.require_network_isolation;
  plan.restrict_filesystem = options_.restrict_filesystem;
  plan.require_filesystem = options_.require_filesystem_isolation;
  plan.restrict_process = options_.restrict_process;
  plan.require_process = options_.require_process_isolation;
  plan.block_spawn = options_.block_process_spawn;
  plan.Finalize();

  const pid_t pid = ::fork();
  if (pid < 0) {
    return InternalFailure("fork: " + ErrnoMessage(errno), start);
  }
  if (pid == 0) {
    RunChild(plan);
  }

  // Both sides set the group to close the race with an early kill
  ::setpgid(pid, pid);
  stdin_child.Reset();
  stdout_write.Reset();
  stderr_write.Reset();
  result_write.Reset();
  status_write.Reset();

  int wait_status = 0;
  bool reaped = false;
  auto terminate = [&]() {
    KillGroup(pid);
    if (!reaped) {
      Reap(pid, &wait_status);
      reaped = true;
    }
  };

  // Setup reports arrive before exec; EOF means exec happened or the child died
  for (const auto& report : ReadReports(status_read.get())) {
    const char* feature = DegradedFeature(report.stage);
    if (feature != nullptr) {
      Tracer::LogWarning("isolation_degraded",
                         fmt::format("{} isolation unavailable: {}", feature,
                                     ErrnoMessage(report.error)),
                         {{"feature", feature}, {"pid", pid}});
      continue;
    }
    terminate();
    return InternalFailure(DescribeFailure(report, options_.interpreter), start);
  }
  status_read.Reset();

  if (!SetNonBlocking(stdin_parent.get()) || !SetNonBlocking(stdout_read.get()) ||
      !SetNonBlocking(stderr_read.get()) || !SetNonBlocking(result_read.get())) {
    terminate();
    return InternalFailure("fcntl: " + ErrnoMessage(errno), start);
  }

  OutputBuffer stdout_buffer(options_.max_output_bytes);
  OutputBuffer stderr_buffer(options_.max_stderr_bytes);
  std::string envelope_bytes;
  size_t request_offset = 0;

  bool streaming = static_cast<bool>(on_output);
  // Forward the part of a chunk the buffer kept
  auto capture = [&](OutputBuffer& buffer, OutputStream stream, const char* data, size_t size) {
    const size_t before = buffer.data().size();
    buffer.Append(data, size);
    if (!streaming || buffer.data().size() == before) {
      return;
    }
    try {
      on_output(stream, buffer.data().substr(before));
    } catch (const std::exception& e) {
      streaming = false;
      Tracer::LogWarning("output_callback_failed", e.what(), {{"pid", pid}});
    }
  };
  auto on_stdout = [&](const char* data, size_t size) {
    capture(stdout_buffer, OutputStream::kStdout, data, size);
  };
  auto on_stderr = [&](const char* data, size_t size) {
    capture(stderr_buffer, OutputStream::kStderr, data, size);
  };
  auto on_result = [&](const char* data, size_t size) {
    // Keep one byte past the cap so overflow is detectable
    if (envelope_bytes.size() <= options_.max_result_bytes) {
      envelope_bytes.append(data, std::min(size, options_.max_result_bytes + 1 - envelope_bytes.size()));
    }
  };
  auto drain_all = [&]() {
    if (stdout_read.valid() && !Drain(stdout_read.get(), on_stdout)) stdout_read.Reset();
    if (stderr_read.valid() && !Drain(stderr_read.get(), on_stderr)) stderr_read.Reset();
    if (result_read.valid() && !Drain(result_read.get(), on_result)) result_read.Reset();
  };

  const long rss_limit_kb = static_cast<long>(limits.max_memory_mb) * 1024;
  StopReason stop = StopReason::kNone;
  int poll_errno = 0;

  while (true) {
    std::vector<pollfd> fds;
    if (stdin_parent.valid()) fds.push_back({stdin_parent.get(), POLLOUT, 0});
    if (stdout_read.valid()) fds.push_back({stdout_read.get(), POLLIN, 0});
    if (stderr_read.valid()) fds.push_back({stderr_read.get(), POLLIN, 0});
    if (result_read.valid()) fds.push_back({result_read.get(), POLLIN, 0});

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    const int wait_ms = static_cast<int>(
        std::max<long long>(0, std::min<long long>(options_.poll_interval_ms, remaining)));

    int ready = fds.empty() ? 0 : ::poll(fds.data(), fds.size(), wait_ms);
    if (fds.empty()) {
      ::usleep(static_cast<useconds_t>(wait_ms) * 1000);
    }
    if (ready < 0 && errno != EINTR) {
      poll_errno = errno;
      stop = StopReason::kPollFailure;
      break;
    }

    if (ready > 0) {
      for (const auto& p : fds) {
        if (p.revents == 0) continue;
        if (p.fd == stdin_parent.get()) {
          ssize_t n = ::send(p.fd, request.data() + request_offset,
                             request.size() - request_offset, MSG_NOSIGNAL);
          if (n > 0) {
            request_offset += static_cast<size_t>(n);
          } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            stdin_parent.Reset();
            continue;
          }
          if (request_offset == request.size()) {
            ::shutdown(p.fd, SHUT_WR);
            stdin_parent.Reset();
          }
        } else if (p.fd == stdout_read.get()) {
          if (!Drain(p.fd, on_stdout)) stdout_read.Reset();
        } else if (p.fd == stderr_read.get()) {
          if (!Drain(p.fd, on_stderr)) stderr_read.Reset();
        } else if (p.fd == result_read.get()) {
          if (!Drain(p.fd, on_result)) result_read.Reset();
        }
      }
    }

    if (!reaped) {
      pid_t r = ::waitpid(pid, &wait_status, WNOHANG);
      if (r == pid) {
        reaped = true;
      }
    }
    if (reaped) {
      drain_all();
      break;
    }

    if (envelope_bytes.size() > options_.max_result_bytes) {
      stop = StopReason::kResultOverflow;
    } else if (cancel && cancel->IsCancelled()) {
      stop = StopReason::kCancelled;
    } else if (Clock::now() >= deadline) {
      stop = StopReason::kTimeout;
    } else {
      const long rss_kb = ReadRssKb(pid);
      if (rss_kb > rss_limit_kb) {
        stop = StopReason::kMemory;
      }
    }
    if (stop != StopReason::kNone) {
      break;
    }
  }

  terminate();
  drain_all();

  ExecutionResult result;
  result.output = stdout_buffer.Text();

  if (!stderr_buffer.data().empty()) {
    Tracer::LogWarning("sandbox_stderr", stderr_buffer.Text(),
                       {{"pid", pid}, {"truncated", stderr_buffer.truncated()}});
  }

  switch (stop) {
    case StopReason::kTimeout:
      result.error = MakeError(ErrorKind::kTimeout,
                               fmt::format("Execution exceeded timeout of {} seconds",
                                           limits.timeout_seconds));
      break;
    case StopReason::kCancelled:
      result.error = MakeError(ErrorKind::kCancelled, "Execution cancelled");
      break;
    case StopReason::kMemory:
      result.error = MakeError(ErrorKind::kResourceExceeded,
                               fmt::format("Memory usage exceeded {} MB", limits.max_memory_mb));
      break;
    case StopReason::kResultOverflow:
      result.error = MakeError(ErrorKind::kResourceExceeded,
                               fmt::format("Result exceeded {} bytes", options_.max_result_bytes));
      break;
    case StopReason::kPollFailure:
      result.error = MakeError(ErrorKind::kInternalError, "poll: " + ErrnoMessage(poll_errno));
      break;
    case StopReason::kNone: {
      if (envelope_bytes.size() > options_.max_result_bytes) {
        result.error = MakeError(ErrorKind::kResourceExceeded,
                                 fmt::format("Result exceeded {} bytes", options_.max_result_bytes));
        break;
      }
      if (envelope_bytes.empty()) {
        result.error = ClassifyExit(wait_status);
        break;
      }
      nlohmann::json envelope = nlohmann::json::parse(envelope_bytes, nullptr, false);
      std::string envelope_error;
      if (envelope.is_discarded()) {
        result.error = MakeError(ErrorKind::kInternalError, "Malformed result envelope");
      } else if (!ApplyEnvelope(envelope, result, &envelope_error)) {
        result.error = MakeError(ErrorKind::kInternalError, envelope_error);
      }
      break;
    }
  }

  result.success = !result.error.has_value();
  if (!KeepsArtifacts(result.error_kind())) {
    result.images.clear();
    result.figures.clear();
    result.variables = nlohmann::json::object();
  }
  if (result.error_kind() == ErrorKind::kInternalError) {
    Tracer::LogError("internal_error", result.error->message, {{"runner", "process"}, {"pid", pid}});
  }

  result.execution_time = SecondsSince(start);
  result.timestamp = UtcTimestamp();
  return result;
}

}  // namespace analysis_sandbox
