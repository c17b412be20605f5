// === src/ContentNormalizer/ContentNormalizer.cpp ===
#include "ContentNormalizer.hpp"
#include <cctype>
#include <utility>

namespace {

const uint32_t kReplacementChar = 0xFFFD;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int base64_value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

// Desc: decode one UTF-8 code point at s[i], rejecting overlongs and surrogates
// In: const std::string& s, size_t& i (advanced past the sequence, or by 1 on error), uint32_t& cp
// Out: bool (false on an invalid sequence)
bool next_code_point(const std::string& s, size_t& i, uint32_t& cp) {
    const unsigned char b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) { cp = b0; i += 1; return true; }

    size_t len = 0;
    uint32_t min = 0;
    if      ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; min = 0x10000; }
    else { i += 1; return false; }

    if (i + len > s.size()) { i += 1; return false; }
    for (size_t k = 1; k < len; ++k) {
        const unsigned char b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) { i += 1; return false; }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) { i += 1; return false; }
    i += len;
    return true;
}

// Roughly str.isprintable(): no controls, separators other than ' ', or format chars.
bool is_printable(uint32_t cp) {
    if (cp == 0x20) return true;
    if (cp < 0x20 || cp == 0x7F) return false;
    if (cp >= 0x80 && cp <= 0xA0) return false;
    if (cp == 0xAD) return false;
    if (cp >= 0x2000 && cp <= 0x200F) return false;
    if (cp >= 0x2028 && cp <= 0x202F) return false;
    if (cp >= 0x2060 && cp <= 0x206F) return false;
    if (cp == 0x3000 || cp == 0xFEFF) return false;
    if (cp >= 0xE000 && cp <= 0xF8FF) return false;
    if (cp >= 0xFFF9 && cp <= 0xFFFB) return false;
    if (cp >= 0xE0000) return false;
    return true;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_base64_alphabet(char c) {
    return base64_value(static_cast<unsigned char>(c)) >= 0 || c == '=';
}

// Desc: replace each <delim>x<delim> with x (x non-empty, single line, shortest)
// In: const std::string& s, const std::string& delim
// Out: std::string
std::string unwrap_delimited(const std::string& s, const std::string& delim) {
    std::string out;
    out.reserve(s.size());
    const size_t n = delim.size();
    size_t i = 0;
    while (i < s.size()) {
        if (s.compare(i, n, delim) == 0) {
            const size_t body = i + n;
            const size_t close = (body < s.size()) ? s.find(delim, body + 1) : std::string::npos;
            if (close != std::string::npos) {
                const size_t nl = s.find('\n', body);
                if (nl == std::string::npos || nl >= close) {
                    out.append(s, body, close - body);
                    i = close + n;
                    continue;
                }
            }
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

// Desc: drop ```...``` blocks entirely (may span lines)
// In: const std::string& s
// Out: std::string
std::string drop_fenced_blocks(const std::string& s) {
    static const std::string fence = "```";
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s.compare(i, fence.size(), fence) == 0) {
            const size_t close = s.find(fence, i + fence.size());
            if (close != std::string::npos) {
                i = close + fence.size();
                continue;
            }
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

// Desc: remove a run of 1..max_run markers at line start plus the whitespace after it
// In: const std::string& s, char marker, size_t max_run
// Out: std::string
std::string strip_line_markers(const std::string& s, char marker, size_t max_run) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const bool line_start = (i == 0 || s[i - 1] == '\n');
        if (line_start && s[i] == marker) {
            size_t j = i;
            while (j < s.size() && s[j] == marker && j - i < max_run) ++j;
            if (j < s.size() && is_space(s[j])) {
                while (j < s.size() && is_space(s[j])) ++j;
                i = j;
                continue;
            }
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

// Desc: peel one encoding layer (URL first, then whole-string Base64)
// In: const std::string& current, std::string& next
// Out: bool (true if a layer was removed)
bool decode_layer(const std::string& current, std::string& next) {
    if (ContentNormalizer::url_decode(current, next)) return true;

    if (current.size() < ContentNormalizer::kMinBase64Length) return false;
    for (char c : current) {
        if (!is_base64_alphabet(c)) return false;
    }
    std::string bytes;
    if (!ContentNormalizer::base64_decode(current, bytes)) return false;
    if (!ContentNormalizer::looks_like_text(bytes)) return false;
    if (bytes == current) return false;
    next = std::move(bytes);
    return true;
}

} // namespace


// Desc: iteratively decode URL/Base64 layers, at most kMaxDecodeIterations
// In: const std::string& content
// Out: std::string (content itself when no layer applies)
std::string ContentNormalizer::fully_decode(const std::string& content) {
    std::string current = content;
    for (int i = 0; i < kMaxDecodeIterations; ++i) {
        std::string next;
        if (!decode_layer(current, next)) break;
        current = std::move(next);
    }
    return current;
}

// Desc: strip markdown constructs, one non-recursive pass per construct
// In: const std::string& content
// Out: std::string
std::string ContentNormalizer::strip_markdown(const std::string& content) {
    std::string s = unwrap_delimited(content, "~~");
    s = unwrap_delimited(s, "**");
    s = unwrap_delimited(s, "__");
    s = unwrap_delimited(s, "*");
    s = unwrap_delimited(s, "_");
    s = unwrap_delimited(s, "`");
    s = drop_fenced_blocks(s);
    s = strip_line_markers(s, '#', 6);
    s = strip_line_markers(s, '>', 1);
    return s;
}

bool ContentNormalizer::url_decode(const std::string& in, std::string& out) {
    if (in.find('%') == std::string::npos) return false;

    std::string bytes;
    bytes.reserve(in.size());
    bool decoded_any = false;
    size_t i = 0;
    while (i < in.size()) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = hex_value(in[i + 1]);
            const int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                bytes.push_back(static_cast<char>((hi << 4) | lo));
                decoded_any = true;
                i += 3;
                continue;
            }
        }
        bytes.push_back(in[i]);
        ++i;
    }
    if (!decoded_any) return false;

    std::string text = sanitize_utf8(bytes);
    if (text == in) return false;
    out = std::move(text);
    return true;
}

bool ContentNormalizer::base64_decode(const std::string& in, std::string& out) {
    if (in.empty() || in.size() % 4 != 0) return false;

    size_t pad = 0;
    while (pad < in.size() && in[in.size() - 1 - pad] == '=') ++pad;
    if (pad > 2) return false;

    std::string bytes;
    bytes.reserve(in.size() / 4 * 3);
    uint32_t acc = 0;
    int bits = 0;
    for (size_t i = 0; i < in.size() - pad; ++i) {
        const int v = base64_value(static_cast<unsigned char>(in[i]));
        if (v < 0) return false;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    out = std::move(bytes);
    return true;
}

bool ContentNormalizer::looks_like_text(const std::string& bytes) {
    if (!is_valid_utf8(bytes)) return false;

    size_t total = 0, printable = 0;
    size_t i = 0;
    while (i < bytes.size()) {
        uint32_t cp = 0;
        next_code_point(bytes, i, cp);
        ++total;
        if (is_printable(cp)) ++printable;
    }
    if (total <= 10) return false;
    return static_cast<double>(printable) / static_cast<double>(total) > 0.7;
}

bool ContentNormalizer::is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp = 0;
        if (!next_code_point(s, i, cp)) return false;
    }
    return true;
}

std::string ContentNormalizer::sanitize_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const size_t start = i;
        uint32_t cp = 0;
        if (next_code_point(s, i, cp)) {
            out.append(s, start, i - start);
        } else {
            append_utf8(out, kReplacementChar);
        }
    }
    return out;
}

size_t ContentNormalizer::utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string ContentNormalizer::truncate_utf8(const std::string& s, size_t max_code_points) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (seen == max_code_points) return s.substr(0, i);
            ++seen;
        }
    }
    return s;
}

std::string ContentNormalizer::ascii_lower(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

void ContentNormalizer::append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}
