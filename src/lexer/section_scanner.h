#pragma once

#include "common/diagnostics.h"

#include <array>
#include <string>
#include <vector>

namespace prism {

enum class SectionKind {
    Markup,  // <template>
    Style,   // <style>
    Logic,   // <script>
};

const char* sectionTagName(SectionKind kind);

struct Section {
    SectionKind kind = SectionKind::Markup;
    bool present = false;
    bool valid = true;             // false once a MalformedSection error hit it
    std::string text;              // raw content between the markers
    SourceLocation start;          // first character of `text`
    SourceLocation marker;         // the opening marker
    std::vector<std::string> attributes;

    bool hasAttribute(const std::string& name) const;
};

// Splits raw unit text into its markup, style and logic sections.
class SectionScanner {
public:
    SectionScanner(const std::string& source, const std::string& unit, DiagnosticEngine& diag);

    // Indexed by SectionKind.
    std::array<Section, 3> scan();

private:
    bool startsWith(const char* s) const;
    bool atSectionOpen(SectionKind* kind) const;
    bool atSectionClose(SectionKind kind, size_t* length) const;
    void skipTo(size_t target);
    void skipWhitespace();
    SourceLocation here() const;

    bool scanSection(SectionKind kind, std::array<Section, 3>& sections);

    std::string source_;
    std::string unit_;
    DiagnosticEngine& diag_;

    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t col_ = 1;
};

} // namespace prism
