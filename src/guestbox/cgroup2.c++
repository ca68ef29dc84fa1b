#include "cgroup2.h"
#include "util.h"

#include <kj/debug.h>
#include <string.h>

namespace guestbox {

Cgroup::Cgroup(kj::StringPtr path)
  : dirfd(raiiOpen(path, O_DIRECTORY|O_CLOEXEC))
{}

Cgroup::Cgroup(kj::AutoCloseFd&& dirfd)
  : dirfd(kj::mv(dirfd))
{}

Cgroup Cgroup::getOrMakeChild(kj::StringPtr path) {
  KJ_SYSCALL_HANDLE_ERRORS(mkdirat(dirfd.get(), path.cStr(), 0700)) {
    case EEXIST:
      break;
    default:
      KJ_FAIL_SYSCALL("mkdirat()", error, path);
  }

  return getChild(path);
}

Cgroup Cgroup::getChild(kj::StringPtr path) {
  return Cgroup(raiiOpenAt(dirfd.get(), path, O_DIRECTORY|O_CLOEXEC));
}

bool Cgroup::tryRemoveChild(kj::StringPtr path) {
  KJ_SYSCALL_HANDLE_ERRORS(unlinkat(dirfd.get(), path.cStr(), AT_REMOVEDIR)) {
    case EBUSY:
      return false;
    case ENOENT:
      return true;
    default:
      KJ_FAIL_SYSCALL("unlinkat()", error, path);
  }
  return true;
}

void Cgroup::writeFile(kj::StringPtr name, kj::StringPtr content) {
  auto fd = raiiOpenAt(dirfd.get(), name, O_WRONLY|O_CLOEXEC);
  KJ_SYSCALL(write(fd.get(), content.begin(), content.size()), name);
}

void Cgroup::addPid(pid_t pid) {
  writeFile("cgroup.procs", kj::str(pid));
}

void Cgroup::setMemoryMax(uint64_t bytes) {
  writeFile("memory.max", kj::str(bytes));
  // Don't let the kernel quietly swap the guest out instead of enforcing the limit.
  KJ_IF_MAYBE(fd, raiiOpenAtIfExists(dirfd.get(), "memory.swap.max", O_WRONLY|O_CLOEXEC)) {
    KJ_SYSCALL(write(fd->get(), "0", 1));
  }
}

uint64_t Cgroup::getOomKillCount() {
  auto text = readAll(raiiOpenAt(dirfd.get(), "memory.events", O_RDONLY|O_CLOEXEC));
  for (auto& line: splitLines(text)) {
    if (line.startsWith("oom_kill ")) {
      KJ_IF_MAYBE(count, parseUInt64(trim(line.slice(strlen("oom_kill "))), 10)) {
        return *count;
      }
    }
  }
  return 0;
}

kj::Maybe<uint64_t> Cgroup::getMemoryPeak() {
  KJ_IF_MAYBE(fd, raiiOpenAtIfExists(dirfd.get(), "memory.peak", O_RDONLY|O_CLOEXEC)) {
    return parseUInt64(trim(readAll(*fd)), 10);
  } else {
    return nullptr;
  }
}

}  // namespace guestbox
