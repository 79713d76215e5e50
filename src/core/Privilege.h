// Linux privilege & sandbox helpers (best-effort; compile-time gated)
#pragma once
#include <vector>

namespace asset_scan {
// Returns false when capabilities could not be changed.
bool drop_capabilities(bool keep_cap_dac);
bool apply_seccomp_profile();
bool is_privilege_available();
bool is_seccomp_available();
// Syscall numbers permitted once the discovery profile is applied.
std::vector<int> seccomp_allowed_syscalls();
int get_seccomp_allowed_syscalls_count();
}
