#include "EncodingDecoder.hpp"
#include "ContentNormalizer.hpp"
#include <cstdint>
#include <utility>

namespace {

bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_b64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

bool hex_at(const std::string& s, size_t pos, size_t n, uint32_t& value) {
    if (pos + n > s.size()) return false;
    value = 0;
    for (size_t k = 0; k < n; ++k) {
        const char c = s[pos + k];
        if (!is_hex(c)) return false;
        const uint32_t d = (c <= '9') ? static_cast<uint32_t>(c - '0')
                                      : static_cast<uint32_t>((c | 0x20) - 'a' + 10);
        value = (value << 4) | d;
    }
    return true;
}

// Number of back-to-back %XX triplets starting at pos.
size_t percent_run(const std::string& s, size_t pos) {
    size_t n = 0;
    while (pos + 2 < s.size() && s[pos] == '%' && is_hex(s[pos + 1]) && is_hex(s[pos + 2])) {
        ++n;
        pos += 3;
    }
    return n;
}

// Length in bytes of one \uXXXX or \UXXXXXXXX escape at pos, 0 if none.
size_t unicode_escape_at(const std::string& s, size_t pos, bool allow_long) {
    if (pos + 1 >= s.size() || s[pos] != '\\') return 0;
    uint32_t v = 0;
    if (s[pos + 1] == 'u' && hex_at(s, pos + 2, 4, v)) return 6;
    if (allow_long && s[pos + 1] == 'U' && hex_at(s, pos + 2, 8, v)) return 10;
    return 0;
}

std::string preview(const std::string& s) {
    if (ContentNormalizer::utf8_length(s) <= EncodingDecoder::kOriginalPreview) return s;
    return ContentNormalizer::truncate_utf8(s, EncodingDecoder::kOriginalPreview) + "...";
}

} // namespace


// Desc: collect decodable encoded segments of content, in base64/url/unicode order
// In: const std::string& content
// Out: std::vector<EncodingFinding> (empty when nothing decodes)
std::vector<EncodingFinding> EncodingDecoder::decode_and_scan(const std::string& content) {
    std::vector<EncodingFinding> findings;
    if (content.empty()) return findings;
    scanBase64_(content, findings);
    scanUrl_(content, findings);
    scanUnicodeEscapes_(content, findings);
    return findings;
}

void EncodingDecoder::scanBase64_(const std::string& content, std::vector<EncodingFinding>& out) {
    size_t i = 0;
    while (i < content.size()) {
        if (!is_b64_char(content[i])) { ++i; continue; }
        size_t end = i;
        while (end < content.size() && is_b64_char(content[end])) ++end;
        if (end - i < kMinBase64Run) { i = end; continue; }

        size_t pad = 0;
        while (pad < 2 && end < content.size() && content[end] == '=') { ++end; ++pad; }

        const std::string run = content.substr(i, end - i);
        i = end;

        std::string padded = run;
        if (padded.size() % 4 != 0) padded.append(4 - padded.size() % 4, '=');

        std::string bytes;
        if (!ContentNormalizer::base64_decode(padded, bytes)) continue;
        if (!ContentNormalizer::looks_like_text(bytes)) continue;
        out.push_back(EncodingFinding{"base64", bytes, preview(run)});
    }
}

void EncodingDecoder::scanUrl_(const std::string& content, std::vector<EncodingFinding>& out) {
    size_t runs = 0;
    size_t i = 0;
    while (i < content.size()) {
        const size_t n = percent_run(content, i);
        if (n > 0) { ++runs; i += n * 3; }
        else ++i;
    }
    if (runs < kMinUrlRuns) return;

    std::string decoded;
    if (!ContentNormalizer::url_decode(content, decoded)) return;
    if (ContentNormalizer::utf8_length(decoded) <= kMinDecodedLength) return;
    out.push_back(EncodingFinding{"url", decoded, preview(content)});
}

void EncodingDecoder::scanUnicodeEscapes_(const std::string& content, std::vector<EncodingFinding>& out) {
    size_t runs = 0;
    size_t i = 0;
    while (i < content.size()) {
        size_t len = unicode_escape_at(content, i, true);
        if (len == 0) { ++i; continue; }
        ++runs;
        while (len > 0) {
            i += len;
            len = unicode_escape_at(content, i, true);
        }
    }
    if (runs < kMinUnicodeRuns) return;

    std::string decoded;
    if (!unescape_unicode(content, decoded)) return;
    if (decoded == content) return;
    if (ContentNormalizer::utf8_length(decoded) <= kMinDecodedLength) return;
    out.push_back(EncodingFinding{"unicode_escape", decoded, preview(content)});
}

bool EncodingDecoder::unescape_unicode(const std::string& in, std::string& out) {
    std::string result;
    result.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        if (in[i] != '\\' || i + 1 >= in.size()) {
            result.push_back(in[i]);
            ++i;
            continue;
        }
        const char kind = in[i + 1];
        uint32_t cp = 0;
        if (kind == 'u' && hex_at(in, i + 2, 4, cp)) {
            i += 6;
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                uint32_t low = 0;
                if (i + 1 < in.size() && in[i] == '\\' && in[i + 1] == 'u' &&
                    hex_at(in, i + 2, 4, low) && low >= 0xDC00 && low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    i += 6;
                } else {
                    cp = 0xFFFD;
                }
            } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                cp = 0xFFFD;
            }
            ContentNormalizer::append_utf8(result, cp);
        } else if (kind == 'U' && hex_at(in, i + 2, 8, cp)) {
            if (cp > 0x10FFFF) return false;
            if (cp >= 0xD800 && cp <= 0xDFFF) cp = 0xFFFD;
            ContentNormalizer::append_utf8(result, cp);
            i += 10;
        } else if (kind == '\\') {
            result.push_back('\\');
            i += 2;
        } else {
            result.push_back(in[i]);
            ++i;
        }
    }
    out = std::move(result);
    return true;
}

bool EncodingDecoder::has_encoding(const std::string& content) {
    size_t b64 = 0;
    for (size_t i = 0; i < content.size(); ++i) {
        b64 = is_b64_char(content[i]) ? b64 + 1 : 0;
        if (b64 >= 30) return true;
        if (percent_run(content, i) >= 3) return true;
        const size_t first = unicode_escape_at(content, i, false);
        if (first > 0 && unicode_escape_at(content, i + first, false) > 0) return true;
    }
    return false;
}
