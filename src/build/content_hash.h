#pragma once

#include <string>

namespace prism {

// Content hashing backed by libgit2: the git blob SHA-1 of a buffer, the
// same id `git hash-object` prints. Holds a reference on the library for
// its lifetime.
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    // 40 lowercase hex digits. Throws std::runtime_error if libgit2 fails.
    std::string hash(const std::string& data) const;

    // Scope token of a unit: "p" + the first 8 hex digits of the hash of
    // its identity. Stable across builds and distinct per unit.
    std::string scopeToken(const std::string& unit) const;

private:
    bool initialized_ = false;
};

} // namespace prism
