#ifndef OIGRADE_SANDBOX_H_
#define OIGRADE_SANDBOX_H_

#include <string>
#include <vector>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  struct cjail_ctx ctx_;
 public:
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
 public:
  std::vector<std::string> command;
  std::vector<std::string> envs;
  std::string workdir;
  int fd_input, fd_output, fd_error; // -1 for not dup
  int uid, gid;
  long wall_time; // us
  long vss; // KiB
  bool unlimited_stack;
  long fsize; // KiB

  SandboxOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0),
      vss(0),
      unlimited_stack(true),
      fsize(0) {}
  // the result is invalidated after reassignment/reallocation of any string/vector member
  CJailCtxClass ToCJailCtx() const;
};

// Runs cjail in a forked child; the cjail context is prepared in the parent.
// Limits that cjail does not cover are applied in the child before cjail_exec,
// so the jailed program inherits them from its first instruction.
// timekill = -1 in the result means the sandbox itself failed (errno in oomkill)
struct cjail_result SandboxExec(const SandboxOptions&);

#endif  // OIGRADE_SANDBOX_H_
