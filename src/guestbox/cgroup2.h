#ifndef GUESTBOX_CGROUP2_H_
#define GUESTBOX_CGROUP2_H_

#include <sys/types.h>  // For pid_t
#include <kj/io.h>
#include <kj/string.h>
#include <inttypes.h>

namespace guestbox {

class Cgroup {
  // A Linux control group (version 2).

public:
  Cgroup() = delete;
  KJ_DISALLOW_COPY(Cgroup);
  Cgroup(Cgroup&&) noexcept = default;

  Cgroup(kj::StringPtr path);
  // Open the cgroup corresponding to the directory `path`.

  Cgroup getOrMakeChild(kj::StringPtr path);
  // Open a cgroup that is a child of this one, creating it if it does not
  // exist.

  Cgroup getChild(kj::StringPtr path);

  bool tryRemoveChild(kj::StringPtr path);
  // Delete a child of this cgroup. Returns false if the child still contains
  // processes, which happens briefly while a dying pid namespace is torn down.

  void addPid(pid_t pid);
  // Add the given process to the cgroup.

  void setMemoryMax(uint64_t bytes);

  uint64_t getOomKillCount();
  // The `oom_kill` counter from memory.events.

  kj::Maybe<uint64_t> getMemoryPeak();
  // memory.peak, on kernels that have it.

private:
  Cgroup(kj::AutoCloseFd&& dirfd);
  kj::AutoCloseFd dirfd;

  void writeFile(kj::StringPtr name, kj::StringPtr content);
};

}  // namespace guestbox

#endif
