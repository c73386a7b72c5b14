#pragma once

#include <cstdint>
#include <string>

namespace prism {

// `file` holds the unit identity (e.g. "components/card"), not a disk path.
struct SourceLocation {
    std::string file;
    uint32_t line = 1;
    uint32_t col = 1;
    uint32_t offset = 0;

    std::string str() const {
        return file + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
};

struct SourceSpan {
    SourceLocation start;
    SourceLocation end;
};

} // namespace prism
