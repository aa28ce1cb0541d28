#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace fastaseek {

enum class FastaErrc : uint8_t {
    kOk = 0,
    kMalformedIndex,   // unparsable .fai row or field, duplicate name
    kUnknownSequence,  // name absent from the index
    kInvalidRange,     // start > stop
    kOutOfBounds,      // stop > sequence length
    kUnexpectedEof,    // data file shorter than the index implies
    kIo,               // open/seek/read/write failure
    kReaderBusy,       // reader is leased by a live iterator
    kMalformedRecord,  // FASTA input not starting with '>'
    kNotOpen,          // reader was never opened
};

inline const char* errc_name(FastaErrc code) {
    switch (code) {
        case FastaErrc::kOk:              return "ok";
        case FastaErrc::kMalformedIndex:  return "malformed index";
        case FastaErrc::kUnknownSequence: return "unknown sequence";
        case FastaErrc::kInvalidRange:    return "invalid range";
        case FastaErrc::kOutOfBounds:     return "out of bounds";
        case FastaErrc::kUnexpectedEof:   return "unexpected end of data";
        case FastaErrc::kIo:              return "I/O error";
        case FastaErrc::kReaderBusy:      return "reader busy";
        case FastaErrc::kMalformedRecord: return "malformed record";
        case FastaErrc::kNotOpen:         return "reader not open";
    }
    return "unknown error";
}

// Result of a fallible operation. Outputs are returned through
// reference parameters; code == kOk means they are valid.
struct Status {
    FastaErrc code = FastaErrc::kOk;
    std::string message;

    bool ok() const { return code == FastaErrc::kOk; }

    // "<kind>: <message>" for log lines
    std::string to_string() const {
        if (message.empty()) return errc_name(code);
        return std::string(errc_name(code)) + ": " + message;
    }
};

inline Status make_status(FastaErrc code, std::string message) {
    Status st;
    st.code = code;
    st.message = std::move(message);
    return st;
}

} // namespace fastaseek
