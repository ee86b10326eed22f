#include <relgraph/graph/model/node_palette.h>

#include <cmath>
#include <cstdio>

namespace relgraph {
namespace graph {

namespace {
constexpr float kRestLengthPerHint = 40.0f;
constexpr float kRestLengthBase = 60.0f;
constexpr float kIndirectRestLengthBonus = 40.0f;
constexpr float kRadiusBase = 22.0f;
constexpr float kRadiusPerHint = 2.5f;

const NodeKindStyle kFallbackStyle{"default", "\xF0\x9F\x94\x97", IM_COL32(0x6B, 0x72, 0x80, 0xFF), "Other"};

int HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}

const std::vector<NodeKindStyle>& NodeKindStyles() {
    static const std::vector<NodeKindStyle> styles = {
        {"person", "\xF0\x9F\x91\xA4", IM_COL32(0xEC, 0x48, 0x99, 0xFF), "Historical figures related to the source"},
        {"event", "\xF0\x9F\x97\x93\xEF\xB8\x8F", IM_COL32(0xF9, 0x73, 0x16, 0xFF), "Historical events connected to the source"},
        {"concept", "\xF0\x9F\x92\xA1", IM_COL32(0x8B, 0x5C, 0xF6, 0xFF), "Ideas and intellectual frameworks"},
        {"place", "\xF0\x9F\x93\x8D", IM_COL32(0x10, 0xB9, 0x81, 0xFF), "Geographical locations"},
        {"work", "\xF0\x9F\x93\x9A", IM_COL32(0x3B, 0x82, 0xF6, 0xFF), "Books, articles, and creative works"},
        {"organization", "\xF0\x9F\x8F\x9B\xEF\xB8\x8F", IM_COL32(0xF5, 0x9E, 0x0B, 0xFF), "Institutions and groups"},
        {"fact", "\xF0\x9F\x93\x8B", IM_COL32(0x06, 0xB6, 0xD4, 0xFF), "Related factual information"},
        {"source", "\xF0\x9F\x93\x84", IM_COL32(0x63, 0x66, 0xF1, 0xFF), "The analyzed source"},
    };
    return styles;
}

const NodeKindStyle& StyleForKind(const std::string& kind) {
    for (const auto& style : NodeKindStyles()) {
        if (kind == style.kind) return style;
    }
    return kFallbackStyle;
}

std::string GlyphForKind(const std::string& kind) {
    return StyleForKind(kind).glyph;
}

ImU32 ColorForKind(const std::string& kind) {
    return StyleForKind(kind).color;
}

float RadiusForDistance(float distance_hint) {
    return kRadiusBase - distance_hint * kRadiusPerHint;
}

float RestLengthFor(float distance_hint, Relationship relationship) {
    float length = distance_hint * kRestLengthPerHint + kRestLengthBase;
    if (relationship == Relationship::INDIRECT) {
        length += kIndirectRestLengthBonus;
    }
    return length;
}

bool IsValidDistanceHint(double distance) {
    return std::isfinite(distance) && distance >= kMinDistanceHint && distance <= kMaxDistanceHint;
}

std::optional<ImU32> ParseHexColor(const std::string& text) {
    if (text.empty() || text[0] != '#') return std::nullopt;
    std::string digits = text.substr(1);
    if (digits.size() == 3) {
        std::string expanded;
        for (char c : digits) {
            expanded += c;
            expanded += c;
        }
        digits = expanded;
    }
    if (digits.size() != 6 && digits.size() != 8) return std::nullopt;

    int channels[4] = {0, 0, 0, 0xFF};
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = HexDigit(digits[i]);
        int lo = HexDigit(digits[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        channels[i / 2] = hi * 16 + lo;
    }
    return IM_COL32(channels[0], channels[1], channels[2], channels[3]);
}

std::string ToHexColor(ImU32 color) {
    unsigned r = (color >> IM_COL32_R_SHIFT) & 0xFF;
    unsigned g = (color >> IM_COL32_G_SHIFT) & 0xFF;
    unsigned b = (color >> IM_COL32_B_SHIFT) & 0xFF;
    unsigned a = (color >> IM_COL32_A_SHIFT) & 0xFF;
    char buffer[16];
    if (a == 0xFF) {
        std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", r, g, b);
    } else {
        std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X%02X", r, g, b, a);
    }
    return buffer;
}

} // namespace graph
} // namespace relgraph
