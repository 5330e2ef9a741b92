#include "utf8_decoder.hpp"

namespace kbchat {

namespace {

const char* const kReplacement = "\xEF\xBF\xBD"; // U+FFFD

// Number of continuation bytes for a lead byte, or -1 if it cannot start a sequence.
int continuation_count(unsigned char lead) {
    if (lead >= 0xC2 && lead <= 0xDF) return 1;
    if (lead >= 0xE0 && lead <= 0xEF) return 2;
    if (lead >= 0xF0 && lead <= 0xF4) return 3;
    return -1; // overlong leads C0/C1, > F4, or a continuation byte
}

// Valid range of the first continuation byte; some leads are stricter.
bool first_continuation_ok(unsigned char lead, unsigned char c) {
    switch (lead) {
        case 0xE0: return c >= 0xA0 && c <= 0xBF; // overlong 3-byte
        case 0xED: return c >= 0x80 && c <= 0x9F; // UTF-16 surrogate
        case 0xF0: return c >= 0x90 && c <= 0xBF; // overlong 4-byte
        case 0xF4: return c >= 0x80 && c <= 0x8F; // > U+10FFFF
        default:   return (c & 0xC0) == 0x80;
    }
}

} // namespace

std::string Utf8Decoder::decode(const std::string& bytes) {
    std::string in;
    in.reserve(pending_.size() + bytes.size());
    in += pending_;
    in += bytes;
    pending_.clear();

    std::string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size()) {
        auto lead = static_cast<unsigned char>(in[i]);
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        int need = continuation_count(lead);
        if (need < 0) {
            out += kReplacement;
            ++i;
            continue;
        }

        size_t k = 1;
        bool bad = false;
        for (; k <= static_cast<size_t>(need); ++k) {
            if (i + k >= in.size()) break; // cut off at end of chunk
            auto c = static_cast<unsigned char>(in[i + k]);
            bool ok = (k == 1) ? first_continuation_ok(lead, c) : (c & 0xC0) == 0x80;
            if (!ok) {
                bad = true;
                break;
            }
        }

        if (bad) {
            // Replace the valid prefix; the offending byte is decoded afresh
            out += kReplacement;
            i += k;
        } else if (k <= static_cast<size_t>(need)) {
            pending_ = in.substr(i);
            break;
        } else {
            out.append(in, i, static_cast<size_t>(need) + 1);
            i += static_cast<size_t>(need) + 1;
        }
    }
    return out;
}

std::string Utf8Decoder::finish() {
    if (pending_.empty()) return {};
    pending_.clear();
    return kReplacement;
}

} // namespace kbchat
