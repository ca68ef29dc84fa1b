// Sandstorm - Personal Cloud Sandbox
// Copyright (c) 2014 Sandstorm Development Group, Inc. and contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "sandbox.h"
#include "capability.h"
#include "util.h"
#include <kj/debug.h>
#include <kj/io.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <errno.h>
#include <stdio.h>
#include <mntent.h>
#include <fcntl.h>
#include <unistd.h>
#include <netinet/in.h> // needs to be included before sys/capability.h
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/socket.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/capability.h>
#include <sys/syscall.h>
#include <sys/resource.h>
#include <sys/wait.h>

// We need to define these constants before libseccomp has a chance to inject bogus
// values for them. See https://github.com/seccomp/libseccomp/issues/27
#ifndef __NR_seccomp
#define __NR_seccomp 317
#endif
#ifndef __NR_bpf
#define __NR_bpf 321
#endif
#ifndef __NR_userfaultfd
#define __NR_userfaultfd 323
#endif
#include <seccomp.h>

// In case kernel headers are old.
#ifndef PR_SET_NO_NEW_PRIVS
#define PR_SET_NO_NEW_PRIVS 38
#endif

namespace guestbox {
namespace sandbox {

static void writeSetgroupsIfPresent(const char *contents) {
  KJ_IF_MAYBE(fd, raiiOpenIfExists("/proc/self/setgroups", O_WRONLY | O_CLOEXEC)) {
    kj::FdOutputStream(kj::mv(*fd)).write(contents, strlen(contents));
  }
}

static void writeUserNSMap(const char *type, kj::StringPtr contents) {
  kj::FdOutputStream(raiiOpen(kj::str("/proc/self/", type, "_map").cStr(), O_WRONLY | O_CLOEXEC))
      .write(contents.begin(), contents.size());
}

void hideUserGroupIds(uid_t realUid, gid_t realGid) {
  writeSetgroupsIfPresent("deny\n");
  writeUserNSMap("uid", kj::str("1000 ", realUid, " 1\n"));
  writeUserNSMap("gid", kj::str("1000 ", realGid, " 1\n"));
}

void unshareNamespaces() {
  uid_t uid = getuid();
  gid_t gid = getgid();

  KJ_SYSCALL(unshare(CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWPID |
                     CLONE_NEWNET));

  hideUserGroupIds(uid, gid);

  // Make sure all mounts are private, so nothing we mount propagates back to the host.
  KJ_SYSCALL(mount("none", "/", nullptr, MS_REC | MS_PRIVATE, nullptr));

  KJ_SYSCALL(sethostname("sandbox", 7));
  KJ_SYSCALL(setdomainname("sandbox", 7));
}

// -------------------------------------------------------------------
// Filesystem

struct MountInfo {
  kj::String path;
  unsigned long flags = 0;
};

static kj::Array<MountInfo> getAllMounts() {
  FILE* mounts = fopen("/proc/self/mounts", "r");
  if (mounts == nullptr) {
    KJ_FAIL_SYSCALL("fopen(/proc/self/mounts)", errno);
  }
  KJ_DEFER(fclose(mounts));

  kj::Vector<MountInfo> results;

  while (struct mntent* entry = getmntent(mounts)) {
    MountInfo info;
    info.path = kj::heapString(entry->mnt_dir);

    for (auto opt: split(kj::StringPtr(entry->mnt_opts), ',')) {
      auto optString = kj::heapString(opt);
      if (optString == "ro") {
        info.flags |= MS_RDONLY;
      } else if (optString == "nosuid") {
        info.flags |= MS_NOSUID;
      } else if (optString == "nodev") {
        info.flags |= MS_NODEV;
      } else if (optString == "noexec") {
        info.flags |= MS_NOEXEC;
      } else if (optString == "noatime") {
        // Inside a user namespace the atime flags of an inherited mount are locked, so a
        // remount has to repeat them.
        info.flags |= MS_NOATIME;
      } else if (optString == "nodiratime") {
        info.flags |= MS_NODIRATIME;
      } else if (optString == "relatime") {
        info.flags |= MS_RELATIME;
      }
    }

    results.add(kj::mv(info));
  }

  return results.releaseAsArray();
}

static void remountUnder(kj::StringPtr prefix, unsigned long flagsToAdd) {
  for (auto& mnt: getAllMounts()) {
    if ((mnt.flags & flagsToAdd) != flagsToAdd &&
        mnt.path.startsWith(prefix) &&
        (mnt.path.size() == prefix.size() || mnt.path[prefix.size()] == '/')) {
      KJ_SYSCALL(mount(nullptr, mnt.path.cStr(), nullptr,
                       MS_BIND | MS_REMOUNT | mnt.flags | flagsToAdd, nullptr),
                 mnt.path, prefix);
    }
  }
}

static void ensureExists(kj::StringPtr path, bool asDirectory) {
  if (access(path.cStr(), F_OK) == 0) {
    return;
  }

  KJ_IF_MAYBE(slashPos, path.findLast('/')) {
    if (*slashPos > 0) {
      ensureExists(kj::heapString(path.slice(0, *slashPos)), true);
    }
  }

  if (asDirectory) {
    KJ_SYSCALL(mkdir(path.cStr(), 0755), path);
  } else {
    KJ_SYSCALL(mknod(path.cStr(), S_IFREG | 0644, 0), path);
  }
}

static void makeCharDeviceNode(const char *name, const char* realName) {
  // Creating a real device node with mknod won't work inside a user namespace, so bind the
  // host's node over a regular file instead.
  auto dst = kj::str("dev/", name);
  KJ_SYSCALL(mknod(dst.cStr(), S_IFREG | 0666, 0), dst);
  KJ_SYSCALL(mount(kj::str("/dev/", realName).cStr(), dst.cStr(), nullptr, MS_BIND, nullptr),
             dst);
}

void setupFilesystem(const CapabilityDescriptor& capabilities, kj::StringPtr mountPoint,
                     int workdirFd) {
  KJ_SYSCALL(mount("guestbox-root", mountPoint.cStr(), "tmpfs", MS_NOSUID | MS_NODEV,
                   "size=64k,nr_inodes=256,mode=755"),
             mountPoint);
  KJ_SYSCALL(chdir(mountPoint.cStr()), mountPoint);

  for (auto& mapping: capabilities.getMappings()) {
    auto target = kj::str(mountPoint, mapping.guestPath);
    ensureExists(target, mapping.isDirectory);

    auto source = workdirFd >= 0 && mapping.hostPath == capabilities.getWorkdirHostPath()
        ? kj::str("/proc/self/fd/", workdirFd) : kj::heapString(mapping.hostPath);
    KJ_SYSCALL(mount(source.cStr(), target.cStr(), nullptr, MS_BIND | MS_REC, nullptr),
               source, target);

    switch (mapping.type) {
      case Mapping::Type::WRITABLE:
        remountUnder(target, MS_NOSUID | MS_NODEV);
        break;
      case Mapping::Type::READABLE:
      case Mapping::Type::IMAGE:
        remountUnder(target, MS_RDONLY | MS_NOSUID | MS_NODEV);
        break;
    }
  }

  KJ_SYSCALL(mkdir("dev", 0755));
  KJ_SYSCALL(mount("guestbox-dev", "dev", "tmpfs",
                   MS_NOATIME | MS_NOSUID | MS_NOEXEC | MS_NODEV,
                   "size=1m,nr_inodes=16,mode=755"));
  makeCharDeviceNode("null", "null");
  makeCharDeviceNode("zero", "zero");
  makeCharDeviceNode("random", "urandom");
  makeCharDeviceNode("urandom", "urandom");
  KJ_SYSCALL(mount("dev", "dev", nullptr,
                   MS_REMOUNT | MS_BIND | MS_NOEXEC | MS_NOSUID | MS_NODEV | MS_RDONLY,
                   nullptr));

  // Everything is in place; the root itself becomes read-only.
  KJ_SYSCALL(mount("guestbox-root", mountPoint.cStr(), "tmpfs",
                   MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV,
                   "size=64k,nr_inodes=256,mode=755"),
             mountPoint);
}

void enterRoot(kj::StringPtr mountPoint) {
  // Use Andy's ridiculous pivot_root trick: pivot onto the mount point with the old root
  // stacked on top of the new one, then detach the old root through a saved fd.
  auto oldRootDir = raiiOpen("/", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  KJ_SYSCALL(syscall(SYS_pivot_root, mountPoint.cStr(), mountPoint.cStr()), mountPoint);
  KJ_SYSCALL(fchdir(oldRootDir));
  KJ_SYSCALL(umount2(".", MNT_DETACH));
  KJ_SYSCALL(chdir("/"));
}

// -------------------------------------------------------------------
// Privileges

void setResourceLimits(uint64_t memoryBytes, uint64_t maxFileBytes) {
  struct rlimit limit;
  memset(&limit, 0, sizeof(limit));
  limit.rlim_cur = 1024;
  limit.rlim_max = 4096;
  KJ_SYSCALL(setrlimit(RLIMIT_NOFILE, &limit));

  limit.rlim_cur = 0;
  limit.rlim_max = 0;
  KJ_SYSCALL(setrlimit(RLIMIT_CORE, &limit));

  if (memoryBytes > 0) {
    limit.rlim_cur = memoryBytes;
    limit.rlim_max = memoryBytes;
    KJ_SYSCALL(setrlimit(RLIMIT_AS, &limit), memoryBytes);
  }

  if (maxFileBytes > 0) {
    limit.rlim_cur = maxFileBytes;
    limit.rlim_max = maxFileBytes;
    KJ_SYSCALL(setrlimit(RLIMIT_FSIZE, &limit), maxFileBytes);
  }
}

void dropPrivileges() {
  // Drop all Linux "capabilities". (These are Linux/POSIX "capabilities", which are not true
  // object-capabilities, hence the quotes.)
  struct __user_cap_header_struct hdr;
  struct __user_cap_data_struct data[2];
  hdr.version = _LINUX_CAPABILITY_VERSION_3;
  hdr.pid = 0;
  memset(data, 0, sizeof(data));  // All capabilities disabled!
  KJ_SYSCALL(capset(&hdr, data));

  KJ_SYSCALL(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0));
}

void setupSeccomp() {
  // A blacklist: the interpreters are trusted to be interpreters, and this only cuts away kernel
  // surface that no guest program has any business touching.

  scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
  if (ctx == nullptr)
    KJ_FAIL_SYSCALL("seccomp_init", 0);  // No real error code
  KJ_DEFER(seccomp_release(ctx));

#define CHECK_SECCOMP(call)                   \
  do {                                        \
    if (auto result = (call)) {               \
      KJ_FAIL_SYSCALL(#call, -result);        \
    }                                         \
  } while (0)

  CHECK_SECCOMP(seccomp_attr_set(ctx, SCMP_FLTATR_CTL_NNP, 1));

  // It's easy to inadvertently issue an x32 syscall (e.g. syscall(-1)).  Such syscalls
  // should fail, but there's no need to kill the issuer.
  CHECK_SECCOMP(seccomp_attr_set(ctx, SCMP_FLTATR_ACT_BADARCH, SCMP_ACT_ERRNO(ENOSYS)));

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"  // SCMP_* macros produce these
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(ptrace), 0));

  // The guest has no network, but there is no reason to let it poke at exotic protocol
  // families either. Only local and inet sockets are left.
  static const int BLOCKED_FAMILIES[] = {
    AF_AX25, AF_IPX, AF_APPLETALK, AF_NETROM, AF_BRIDGE, AF_ATMPVC, AF_X25, AF_ROSE, AF_DECnet,
    AF_NETBEUI, AF_SECURITY, AF_KEY
  };
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EAFNOSUPPORT), SCMP_SYS(socket), 1,
     SCMP_A0(SCMP_CMP_GE, AF_NETLINK + 1)));
  for (int family: BLOCKED_FAMILIES) {
    CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EAFNOSUPPORT), SCMP_SYS(socket), 1,
       SCMP_A0(SCMP_CMP_EQ, family)));
  }

  // Disallow DCCP sockets due to Linux CVE-2017-6074. The type can have SOCK_NONBLOCK and
  // SOCK_CLOEXEC or'd in, so mask with the kernel's SOCK_TYPE_MASK.
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPROTONOSUPPORT), SCMP_SYS(socket), 1,
     SCMP_A1(SCMP_CMP_MASKED_EQ, 0x0f, SOCK_DCCP)));

  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(add_key), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(request_key), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(keyctl), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(syslog), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(uselib), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(personality), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(acct), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(modify_ldt), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(set_thread_area), 0));

  // No nested sandboxes.
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(unshare), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(mount), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(umount2), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(pivot_root), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(quotactl), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(clone), 1,
      SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_NEWUSER, CLONE_NEWUSER)));

  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(io_setup), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(io_destroy), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(io_getevents), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(io_submit), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(io_cancel), 0));

  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(remap_file_pages), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(mbind), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(get_mempolicy), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(set_mempolicy), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(migrate_pages), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(move_pages), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(vmsplice), 0));

  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(perf_event_open), 0));

  // Seccomp filters are programs that run in-kernel; guests don't get to load their own.
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EINVAL), SCMP_SYS(prctl), 1,
      SCMP_A0(SCMP_CMP_EQ, PR_SET_SECCOMP)));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(seccomp), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(bpf), 0));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(userfaultfd), 0));

  CHECK_SECCOMP(seccomp_load(ctx));

#pragma GCC diagnostic pop
#undef CHECK_SECCOMP
}

// -------------------------------------------------------------------
// Keeper and guest

static void writeReport(int fd, const KeeperReport& report) {
  kj::FdOutputStream(fd).write(&report, sizeof(report));
}

static void reportFailure(int fd, const kj::Exception& exception) {
  KeeperReport report;
  memset(&report, 0, sizeof(report));
  report.type = KeeperReport::FAILED;
  auto description = exception.getDescription();
  memcpy(report.error, description.begin(),
         kj::min(description.size(), sizeof(report.error) - 1));
  writeReport(fd, report);
}

static void resetSignals() {
  // exec() leaves ignored signals ignored, and the signal mask is inherited, and KJ's event loop
  // likes to block and ignore things.
  for (int i = 1; i < NSIG; i++) {
    signal(i, SIG_DFL);  // Only possible error is EINVAL (invalid signum); we don't care.
  }

  sigset_t sigmask;
  sigemptyset(&sigmask);
  KJ_SYSCALL(sigprocmask(SIG_SETMASK, &sigmask, nullptr));
}

KJ_NORETURN(static void runGuest(const GuestSpec& spec, const KeeperFds& fds));

static void runGuest(const GuestSpec& spec, const KeeperFds& fds) {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    KJ_SYSCALL(prctl(PR_SET_PDEATHSIG, SIGKILL));

    char go;
    ssize_t n;
    KJ_SYSCALL(n = read(fds.startFd, &go, 1));
    if (n == 0) {
      // The engine gave up on this execution before it started.
      _exit(1);
    }

    setupFilesystem(spec.capabilities, spec.mountPoint, fds.workdirFd);
    KJ_SYSCALL(close(fds.workdirFd));
    enterRoot(spec.mountPoint);
    KJ_SYSCALL(chdir(spec.capabilities.getWorkdirGuestPath().cStr()));

    {
      auto devNull = raiiOpen("/dev/null", O_RDONLY | O_CLOEXEC);
      KJ_SYSCALL(dup2(devNull, STDIN_FILENO));
    }
    KJ_SYSCALL(dup2(fds.stdoutFd, STDOUT_FILENO));
    KJ_SYSCALL(dup2(fds.stderrFd, STDERR_FILENO));

    setResourceLimits(spec.memoryBytes, spec.maxFileBytes);
    resetSignals();
    dropPrivileges();
    setupSeccomp();

    KJ_STACK_ARRAY(char*, argv, spec.argv.size() + 1, 16, 64);
    for (auto i: kj::indices(spec.argv)) {
      argv[i] = const_cast<char*>(spec.argv[i].cStr());
    }
    argv[spec.argv.size()] = nullptr;

    KJ_STACK_ARRAY(char*, env, spec.environ.size() + 1, 16, 64);
    for (auto i: kj::indices(spec.environ)) {
      env[i] = const_cast<char*>(spec.environ[i].cStr());
    }
    env[spec.environ.size()] = nullptr;

    KJ_SYSCALL(execve(spec.executable.cStr(), argv.begin(), env.begin()), spec.executable);
    KJ_UNREACHABLE;
  })) {
    auto description = exception->getDescription();
    KJ_IF_MAYBE(writeError, kj::runCatchingExceptions([&]() {
      kj::FdOutputStream(fds.setupErrorFd).write(description.begin(), description.size());
    })) {
      KJ_LOG(ERROR, "guest setup failed and could not be reported", *exception, *writeError);
    }
  }

  _exit(126);
}

int runKeeper(const GuestSpec& spec, const KeeperFds& fds) {
  KJ_SYSCALL(prctl(PR_SET_PDEATHSIG, SIGKILL));

  {
    const int keep[] = {
      fds.stdoutFd, fds.stderrFd, fds.controlFd, fds.startFd, fds.setupErrorFd, fds.workdirFd
    };
    closeFdsExcept(keep);
  }

  pid_t guest = 0;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    unshareNamespaces();
    KJ_SYSCALL(guest = fork());
  })) {
    reportFailure(fds.controlFd, *exception);
    return 1;
  }

  if (guest == 0) {
    runGuest(spec, fds);
  }

  // Only the guest may hold these, or the engine would never see EOF on them.
  KJ_SYSCALL(close(fds.stdoutFd));
  KJ_SYSCALL(close(fds.stderrFd));
  KJ_SYSCALL(close(fds.startFd));
  KJ_SYSCALL(close(fds.setupErrorFd));
  KJ_SYSCALL(close(fds.workdirFd));

  KeeperReport report;
  memset(&report, 0, sizeof(report));
  report.type = KeeperReport::STARTED;
  report.pid = guest;
  writeReport(fds.controlFd, report);

  int status;
  struct rusage usage;
  memset(&usage, 0, sizeof(usage));
  KJ_SYSCALL(wait4(guest, &status, 0, &usage));

  memset(&report, 0, sizeof(report));
  report.type = KeeperReport::EXITED;
  report.pid = guest;
  report.status = status;
  report.maxRssBytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024;
  report.cpuTimeNs =
      (static_cast<uint64_t>(usage.ru_utime.tv_sec) + usage.ru_stime.tv_sec) * 1000000000ull +
      (static_cast<uint64_t>(usage.ru_utime.tv_usec) + usage.ru_stime.tv_usec) * 1000ull;
  writeReport(fds.controlFd, report);

  return 0;
}

}  // namespace sandbox
}  // namespace guestbox
