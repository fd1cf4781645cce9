#include "expansion/language_policy.hpp"
#include "domain/domain_catalog.hpp"

namespace kgx {
namespace language_policy {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

bool is_japanese_code_point(char32_t cp) {
    // Hiragana + Katakana, then CJK Extension A through the unified block
    return (cp >= 0x3040 && cp <= 0x30FF) || (cp >= 0x3400 && cp <= 0x9FFF);
}

} // anonymous namespace

std::vector<char32_t> decode_utf8(const std::string& text) {
    std::vector<char32_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);

        size_t length = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            length = 1;
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
        } else {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        if (i + length > text.size()) {
            out.push_back(kReplacementChar);
            break;
        }

        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!valid) {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += length;
    }

    return out;
}

bool contains_japanese(const std::string& text) {
    for (char32_t cp : decode_utf8(text)) {
        if (is_japanese_code_point(cp)) {
            return true;
        }
    }
    return false;
}

bool is_ascii_only(const std::string& text) {
    if (text.empty()) return false;
    for (unsigned char c : text) {
        if (c >= 0x80) return false;
    }
    return true;
}

bool accepts_node_label(const DomainCatalog& catalog, const std::string& kind, const std::string& label) {
    if (!catalog.requires_japanese_label(kind)) return true;
    if (contains_japanese(label)) return true;
    if (is_ascii_only(label)) return false;
    return true;
}

std::string normalize_edge_label(
    const DomainCatalog& catalog,
    const std::string& target_kind,
    const std::string& label
) {
    if (label.empty() || (!contains_japanese(label) && is_ascii_only(label))) {
        return catalog.relation_label(target_kind);
    }
    return label;
}

} // namespace language_policy
} // namespace kgx
