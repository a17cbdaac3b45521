#pragma once

#include "hatch/result.hpp"

#include <string>
#include <vector>

namespace hatch {

// ============================================================================
// Privilege Context
// ============================================================================
//
// Held for a whole install or uninstall session. Acquiring it checks that the
// process may write everywhere the session will write and takes an exclusive
// lock on the session lock file, so two sessions never interleave. Released
// when the context is destroyed.

class PrivilegeContext {
public:
    // Fails with PRIVILEGE_ERROR (nothing mutated besides the lock file) when
    //  - require_root is set and the effective user is not root
    //  - the nearest existing ancestor of a writable_dirs entry is not writable
    //  - another session holds the lock
    static Result<PrivilegeContext> acquire(const std::string& lock_path,
                                            const std::vector<std::string>& writable_dirs,
                                            bool require_root = false);

    PrivilegeContext(PrivilegeContext&& other) noexcept;
    PrivilegeContext& operator=(PrivilegeContext&& other) noexcept;
    PrivilegeContext(const PrivilegeContext&) = delete;
    PrivilegeContext& operator=(const PrivilegeContext&) = delete;
    ~PrivilegeContext();

    bool held() const { return fd_ >= 0; }
    const std::string& lockPath() const { return lock_path_; }

private:
    PrivilegeContext(int fd, std::string lock_path) : fd_(fd), lock_path_(std::move(lock_path)) {}

    void release();

    int fd_ = -1;
    std::string lock_path_;
};

// Closest path at or above path that exists ("" if none)
std::string nearest_existing_ancestor(const std::string& path);

} // namespace hatch
