//
// Scanner state for the line joiner
//

#pragma once

#include <cstddef>

namespace dfscan {

// Physical-line cursor over the raw document
struct scanner_context {
    const char* cursor = nullptr;
    const char* eof = nullptr;   // One past the last byte
    std::size_t line = 0;        // 1-based line of the cursor
};

// Quote state carried across joined physical lines
struct quote_state {
    char open = 0;               // '"', '\'' or 0
    std::size_t opened_line = 0; // Line where the quote was opened
};

} // namespace dfscan
