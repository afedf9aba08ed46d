#pragma once

#include "buffer.hpp"
#include <cstddef>

namespace co::http_framing {

// =============================================================================
// Connection Configuration
// =============================================================================

// How the parser treats a line ending in a bare "\n"
enum class line_terminator_policy {
    strict,     // only "\r\n"; a bare "\n" is a protocol error
    lenient     // "\r\n" or "\n"
};

// How the parser treats obsolete header folding (continuation lines
// starting with SP or HTAB)
enum class obs_fold_policy {
    reject,
    unfold      // joined to the previous value with a single SP
};

struct connection_options {
    static constexpr size_t default_max_line_size = 8 * 1024;
    static constexpr size_t default_max_header_block_size = 16 * 1024;

    // Longest start line, header line or chunk-size line
    size_t max_line_size = default_max_line_size;
    // Largest head or trailer block; also the most bytes buffered while an
    // event is still incomplete
    size_t max_header_block_size = default_max_header_block_size;

    line_terminator_policy line_terminators = line_terminator_policy::strict;
    obs_fold_policy obs_fold = obs_fold_policy::reject;

    line_limits limits() const noexcept {
        return line_limits{max_line_size, max_header_block_size,
                           line_terminators == line_terminator_policy::lenient};
    }
};

} // namespace co::http_framing
