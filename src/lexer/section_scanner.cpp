#include "lexer/section_scanner.h"

#include <cctype>
#include <cstring>

namespace prism {

const char* sectionTagName(SectionKind kind) {
    switch (kind) {
        case SectionKind::Markup: return "template";
        case SectionKind::Style:  return "style";
        case SectionKind::Logic:  return "script";
    }
    return "";
}

bool Section::hasAttribute(const std::string& name) const {
    for (const auto& attr : attributes) {
        if (attr == name) return true;
    }
    return false;
}

SectionScanner::SectionScanner(const std::string& source, const std::string& unit,
                               DiagnosticEngine& diag)
    : source_(source), unit_(unit), diag_(diag) {}

SourceLocation SectionScanner::here() const {
    return {unit_, line_, col_, static_cast<uint32_t>(pos_)};
}

bool SectionScanner::startsWith(const char* s) const {
    return source_.compare(pos_, std::strlen(s), s) == 0;
}

void SectionScanner::skipTo(size_t target) {
    while (pos_ < target && pos_ < source_.size()) {
        if (source_[pos_++] == '\n') {
            ++line_;
            col_ = 1;
        } else {
            ++col_;
        }
    }
}

void SectionScanner::skipWhitespace() {
    while (pos_ < source_.size() && std::isspace(static_cast<unsigned char>(source_[pos_]))) {
        skipTo(pos_ + 1);
    }
}

static bool isMarkerBoundary(char c) {
    return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
}

bool SectionScanner::atSectionOpen(SectionKind* kind) const {
    if (pos_ >= source_.size() || source_[pos_] != '<') return false;
    for (SectionKind k : {SectionKind::Markup, SectionKind::Style, SectionKind::Logic}) {
        const char* name = sectionTagName(k);
        size_t len = std::strlen(name);
        if (source_.compare(pos_ + 1, len, name) == 0 &&
            pos_ + 1 + len < source_.size() && isMarkerBoundary(source_[pos_ + 1 + len])) {
            *kind = k;
            return true;
        }
    }
    return false;
}

bool SectionScanner::atSectionClose(SectionKind kind, size_t* length) const {
    const char* name = sectionTagName(kind);
    size_t len = std::strlen(name);
    if (source_.compare(pos_, 2, "</") != 0) return false;
    if (source_.compare(pos_ + 2, len, name) != 0) return false;
    size_t p = pos_ + 2 + len;
    while (p < source_.size() && std::isspace(static_cast<unsigned char>(source_[p]))) ++p;
    if (p >= source_.size() || source_[p] != '>') return false;
    *length = p + 1 - pos_;
    return true;
}

std::array<Section, 3> SectionScanner::scan() {
    std::array<Section, 3> sections;
    sections[0].kind = SectionKind::Markup;
    sections[1].kind = SectionKind::Style;
    sections[2].kind = SectionKind::Logic;

    bool reportedStray = false;

    while (pos_ < source_.size()) {
        skipWhitespace();
        if (pos_ >= source_.size()) break;

        if (startsWith("<!--")) {
            auto end = source_.find("-->", pos_ + 4);
            if (end == std::string::npos) {
                diag_.error(DiagCode::MalformedSection, here(), "unterminated comment");
                break;
            }
            skipTo(end + 3);
            continue;
        }

        SectionKind kind;
        if (atSectionOpen(&kind)) {
            if (!scanSection(kind, sections)) break;
            continue;
        }

        if (!reportedStray) {
            diag_.error(DiagCode::MalformedSection, here(),
                        "unexpected content outside of a <template>, <style> or <script> section");
            reportedStray = true;
        }
        auto next = source_.find('<', pos_ + 1);
        skipTo(next == std::string::npos ? source_.size() : next);
    }

    return sections;
}

// Returns false when scanning cannot continue (the section never closes).
bool SectionScanner::scanSection(SectionKind kind, std::array<Section, 3>& sections) {
    const char* name = sectionTagName(kind);
    SourceLocation markerLoc = here();

    // Opening marker with optional bare attributes: <style global>
    skipTo(pos_ + 1 + std::strlen(name));
    std::vector<std::string> attributes;
    while (pos_ < source_.size() && source_[pos_] != '>') {
        if (std::isspace(static_cast<unsigned char>(source_[pos_]))) {
            skipTo(pos_ + 1);
            continue;
        }
        size_t begin = pos_;
        while (pos_ < source_.size() && source_[pos_] != '>' &&
               !std::isspace(static_cast<unsigned char>(source_[pos_]))) {
            skipTo(pos_ + 1);
        }
        attributes.push_back(source_.substr(begin, pos_ - begin));
    }
    if (pos_ >= source_.size()) {
        diag_.error(DiagCode::MalformedSection, markerLoc,
                    std::string("unterminated <") + name + "> section marker");
        Section& section = sections[static_cast<size_t>(kind)];
        if (!section.present) {
            section.present = true;
            section.valid = false;
            section.marker = markerLoc;
        }
        return false;
    }
    skipTo(pos_ + 1); // '>'

    Section& section = sections[static_cast<size_t>(kind)];
    bool duplicate = section.present;
    if (duplicate) {
        diag_.error(DiagCode::MalformedSection, markerLoc,
                    std::string("duplicate <") + name + "> section");
    }

    SourceLocation contentStart = here();
    size_t contentBegin = pos_;
    bool nested = false;
    int depth = 0;  // <template> elements inside the markup section

    while (pos_ < source_.size()) {
        size_t closeLen = 0;
        if (atSectionClose(kind, &closeLen)) {
            if (depth > 0) {
                --depth;
                skipTo(pos_ + closeLen);
                continue;
            }
            if (!duplicate) {
                section.present = true;
                section.valid = !nested;
                section.text = source_.substr(contentBegin, pos_ - contentBegin);
                section.start = contentStart;
                section.marker = markerLoc;
                section.attributes = std::move(attributes);
            }
            skipTo(pos_ + closeLen);
            return true;
        }

        SectionKind inner;
        if (atSectionOpen(&inner)) {
            if (kind == SectionKind::Markup && inner == SectionKind::Markup) {
                ++depth;
                skipTo(pos_ + 1);
                continue;
            }
            if (!nested) {
                diag_.error(DiagCode::MalformedSection, here(),
                            std::string("<") + sectionTagName(inner) + "> section opened inside <" +
                            name + "> section");
            }
            nested = true;
        }
        skipTo(pos_ + 1);
    }

    diag_.error(DiagCode::MalformedSection, markerLoc,
                std::string("<") + name + "> section is never closed");
    if (!duplicate) {
        section.present = true;
        section.valid = false;
        section.marker = markerLoc;
        section.start = contentStart;
    }
    return false;
}

} // namespace prism
