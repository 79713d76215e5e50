#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/Privilege.h"
#include <sys/syscall.h>
#include <algorithm>
#include <set>

// Only checks that cannot change the state of the test process; nothing here
// drops capabilities or loads a filter.

namespace asset_scan {

TEST(PrivilegeSimpleTest, IsPrivilegeAvailable) {
    bool result = is_privilege_available();
#ifdef ASSET_SCAN_HAVE_LIBCAP
    EXPECT_TRUE(result);
#else
    EXPECT_FALSE(result);
#endif
}

TEST(PrivilegeSimpleTest, IsSeccompAvailable) {
    bool result = is_seccomp_available();
#ifdef ASSET_SCAN_HAVE_SECCOMP
    EXPECT_TRUE(result);
#else
    EXPECT_FALSE(result);
#endif
}

TEST(PrivilegeSimpleTest, AllowListCoversDiscoveryNeeds) {
    auto allowed = seccomp_allowed_syscalls();
    EXPECT_EQ(get_seccomp_allowed_syscalls_count(), static_cast<int>(allowed.size()));
    EXPECT_EQ(std::set<int>(allowed.begin(), allowed.end()).size(), allowed.size());
    EXPECT_THAT(allowed, ::testing::IsSupersetOf({SYS_read, SYS_openat, SYS_getdents64, SYS_socket, SYS_connect, SYS_futex}));
}

TEST(PrivilegeSimpleTest, AllowListPermitsThreadCreation) {
    auto allowed = seccomp_allowed_syscalls();
    EXPECT_NE(std::count(allowed.begin(), allowed.end(), SYS_clone), 0);
#ifdef SYS_clone3
    EXPECT_NE(std::count(allowed.begin(), allowed.end(), SYS_clone3), 0);
#endif
#ifdef SYS_rseq
    EXPECT_NE(std::count(allowed.begin(), allowed.end(), SYS_rseq), 0);
#endif
}

TEST(PrivilegeSimpleTest, AllowListExcludesMutatingSyscalls) {
    auto allowed = seccomp_allowed_syscalls();
    for (int sc : {SYS_unlinkat, SYS_renameat2, SYS_mkdirat, SYS_execve, SYS_bind, SYS_listen, SYS_ptrace}) {
        EXPECT_EQ(std::count(allowed.begin(), allowed.end(), sc), 0) << "syscall " << sc;
    }
}

#ifndef ASSET_SCAN_HAVE_LIBCAP
TEST(PrivilegeSimpleTest, DropWithoutLibcapReportsFailure) {
    EXPECT_FALSE(drop_capabilities(false));
}
#endif

#ifndef ASSET_SCAN_HAVE_SECCOMP
TEST(PrivilegeSimpleTest, SeccompWithoutLibseccompReportsFailure) {
    EXPECT_FALSE(apply_seccomp_profile());
}
#endif

}
