#pragma once
#include <string>

namespace kbchat {

// Incremental UTF-8 decoder. Bytes of a multi-byte sequence that is cut off
// at the end of one chunk are held back and completed by the next chunk.
// Invalid sequences (overlong forms, surrogates, > U+10FFFF, stray
// continuation bytes) are replaced with U+FFFD, one per maximal bad prefix.
class Utf8Decoder {
public:
    // Decode the next chunk. Output is always valid UTF-8.
    std::string decode(const std::string& bytes);

    // End of input: an incomplete held-back sequence becomes U+FFFD.
    std::string finish();

    // Bytes currently held back (0..3)
    size_t pending() const { return pending_.size(); }

    void reset() { pending_.clear(); }

private:
    std::string pending_;
};

} // namespace kbchat
