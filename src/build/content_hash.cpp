#include "build/content_hash.h"

#include <git2.h>

#include <stdexcept>

namespace prism {

ContentHasher::ContentHasher() {
    if (git_libgit2_init() > 0) {
        initialized_ = true;
    }
}

ContentHasher::~ContentHasher() {
    if (initialized_) {
        git_libgit2_shutdown();
    }
}

std::string ContentHasher::hash(const std::string& data) const {
    git_oid oid;
    int err = git_odb_hash(&oid, data.data(), data.size(), GIT_OBJECT_BLOB);
    if (err < 0) {
        const git_error* e = git_error_last();
        throw std::runtime_error(std::string("failed to hash content: ") +
                                 (e ? e->message : "unknown"));
    }

    char oidHex[GIT_OID_SHA1_HEXSIZE + 1];
    git_oid_tostr(oidHex, sizeof(oidHex), &oid);
    return std::string(oidHex);
}

std::string ContentHasher::scopeToken(const std::string& unit) const {
    return "p" + hash(unit).substr(0, 8);
}

} // namespace prism
