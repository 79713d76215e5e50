#include "Privilege.h"
#include "Logging.h"
#include <string>
#include <cerrno>
#include <unistd.h>
#include <sys/syscall.h>
#ifdef ASSET_SCAN_HAVE_LIBCAP
#include <sys/capability.h>
#endif
#ifdef ASSET_SCAN_HAVE_SECCOMP
#include <seccomp.h>
#endif

namespace asset_scan {

namespace {

void log_capabilities(const std::string& context) {
#ifdef ASSET_SCAN_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    }
    cap_free(caps);
#else
    (void)context;
#endif
}

}

bool drop_capabilities(bool keep_cap_dac){
#ifdef ASSET_SCAN_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities (keep_cap_dac=" + std::string(keep_cap_dac ? "true" : "false") + ")");
    log_capabilities("before drop");
    cap_t caps = cap_get_proc();
    if(!caps){
        Logger::instance().error("cap_get_proc failed");
        return false;
    }
    cap_clear(caps);
    if(keep_cap_dac){
        // Discovery only needs to read what it inspects.
        cap_value_t v = CAP_DAC_READ_SEARCH;
        cap_set_flag(caps, CAP_PERMITTED, 1, &v, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 1, &v, CAP_SET);
    }
    bool ok = cap_set_proc(caps) == 0;
    if(!ok) Logger::instance().error("cap_set_proc failed");
    else log_capabilities("after drop");
    cap_free(caps);
    return ok;
#else
    (void)keep_cap_dac;
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
    return false;
#endif
}

std::vector<int> seccomp_allowed_syscalls(){
    // Reads, directory walks, /proc parsing, worker threads and TCP probes.
    std::vector<int> allowed = {
        SYS_read, SYS_write, SYS_pread64, SYS_openat, SYS_close, SYS_fstat, SYS_newfstatat, SYS_statx, SYS_lseek,
        SYS_getdents64, SYS_readlink, SYS_readlinkat, SYS_access, SYS_faccessat, SYS_fcntl, SYS_ioctl,
        SYS_mmap, SYS_mprotect, SYS_munmap, SYS_brk, SYS_madvise, SYS_mremap,
        SYS_rt_sigaction, SYS_rt_sigprocmask, SYS_rt_sigreturn,
        SYS_clone, SYS_set_robust_list, SYS_futex, SYS_sched_yield, SYS_nanosleep, SYS_clock_nanosleep,
        SYS_clock_gettime, SYS_gettid, SYS_getpid, SYS_getrandom, SYS_prlimit64, SYS_uname,
        SYS_getuid, SYS_geteuid, SYS_getgid, SYS_getegid,
        SYS_socket, SYS_connect, SYS_poll, SYS_ppoll, SYS_getsockopt, SYS_setsockopt,
        SYS_sendto, SYS_recvfrom, SYS_sendmmsg,
        SYS_exit, SYS_exit_group
    };
    // glibc creates threads with clone3 and registers rseq per thread; a
    // refused clone3 only falls back to clone on ENOSYS.
#ifdef SYS_clone3
    allowed.push_back(SYS_clone3);
#endif
#ifdef SYS_rseq
    allowed.push_back(SYS_rseq);
#endif
    return allowed;
}

int get_seccomp_allowed_syscalls_count(){
    return static_cast<int>(seccomp_allowed_syscalls().size());
}

bool apply_seccomp_profile(){
#ifdef ASSET_SCAN_HAVE_SECCOMP
    static bool seccomp_applied = false;
    if (seccomp_applied) return true;

    Logger::instance().info("Applying seccomp profile");
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ERRNO(EPERM));
    if(!ctx) {
        Logger::instance().error("Failed to initialize seccomp context");
        return false;
    }
    for(int c : seccomp_allowed_syscalls()){
        if(seccomp_rule_add(ctx, SCMP_ACT_ALLOW, c, 0) != 0){
            Logger::instance().error("Failed to allow syscall " + std::to_string(c) + " in seccomp");
            seccomp_release(ctx);
            return false;
        }
    }
    if(seccomp_load(ctx) != 0){
        Logger::instance().error("Failed to load seccomp profile");
        seccomp_release(ctx);
        return false;
    }
    seccomp_release(ctx);
    seccomp_applied = true;
    return true;
#else
    Logger::instance().info("Seccomp not available (not compiled in)");
    return false;
#endif
}

bool is_privilege_available(){
#ifdef ASSET_SCAN_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

bool is_seccomp_available(){
#ifdef ASSET_SCAN_HAVE_SECCOMP
    return true;
#else
    return false;
#endif
}

}
