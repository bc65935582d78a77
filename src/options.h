// options.h - Translation settings chosen on the command line
#pragma once

// What to do with directives missing from the command table
enum class UnknownPolicy {
    MARK, // emit a LaTeX comment carrying the original line
    DROP, // emit nothing
};

struct Options {
    bool preamble     = true;  // wrap output in \documentclass ... \end{document}
    bool carry_latch  = false; // thread latch state across directives
    bool skip_header  = true;  // skip a "+-" file header on line 1
    bool warnings     = true;  // report recoverable problems on stderr
    UnknownPolicy unknown = UnknownPolicy::MARK;
};
