#include "sandbox.h"

#include <errno.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "utils.h"

CJailCtxClass SandboxOptions::ToCJailCtx() const {
  CJailCtxClass ret;
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd, sharenet
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  // default: chroot (none)
  ctx.working_dir = const_cast<char*>(workdir.data());
  // default: cgroup_root
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_fsize = fsize;
  // default: rlim_stack (no limit); the hard limit is lifted in SandboxExec
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  // default: seccomp_cfg, mount_cfg
  return ret;
}

namespace {

bool ApplyChildLimits(const SandboxOptions& opt) {
  if (opt.unlimited_stack) {
    struct rlimit lim{RLIM_INFINITY, RLIM_INFINITY};
    if (setrlimit(RLIMIT_STACK, &lim) < 0) return false;
  }
  return true;
}

} // namespace

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  // built before fork(): the child must not allocate while other threads may hold heap locks
  CJailCtxClass ctx = opt.ToCJailCtx();
  struct cjail_result ret = {};
  int pipefd[2];
  pid_t pid;
  if (pipe(pipefd) < 0) goto err;
  spdlog::debug("cjail_exec command: {} uid={} wall_time={}us vss={}KiB",
                fmt::format("{}", opt.command), opt.uid, opt.wall_time, opt.vss);
  pid = fork();
  if (pid < 0) {
    close(pipefd[0]);
    close(pipefd[1]);
    goto err;
  }
  if (pid == 0) {
    close(pipefd[0]);
    struct cjail_result res = {};
    if (!ApplyChildLimits(opt)) {
      res.oomkill = errno;
      res.timekill = -1;
    } else if (cjail_exec(&ctx.GetCtx(), &res) < 0) {
      res.oomkill = errno;
      res.timekill = -1;
    }
    IGNORE_RETURN(write(pipefd[1], &res, sizeof(res)));
    _exit(0); // since forked, some atexit() may hang by deadlocks
  }
  close(pipefd[1]);
  {
    ssize_t len = read(pipefd[0], &ret, sizeof(ret));
    int saved_errno = errno;
    close(pipefd[0]);
    waitpid(pid, nullptr, 0);
    if (len != (ssize_t)sizeof(ret)) {
      errno = len < 0 ? saved_errno : EPIPE;
      goto err;
    }
  }
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
err:
  spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
  ret = {};
  ret.oomkill = errno;
  ret.timekill = -1;
  return ret;
}
