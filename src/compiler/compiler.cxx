/*
    Tapec - An optimizing tape language to C compiler
    Compilation pipeline
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "compiler/compiler.hxx"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

#include "compiler/emitter.hxx"
#include "compiler/passes.hxx"

namespace tapec {

int checkBrackets(std::string_view source) {
    std::size_t depth = 0;
    for (char c : source) {
        if (c == '[') {
            ++depth;
        } else if (c == ']') {
            if (depth == 0) return 1;
            --depth;
        }
    }
    return depth ? 2 : 0;
}

TokenStream tokenize(std::string_view source, const CompileOptions& opts) {
    const std::string clean = sanitize(source, opts.extensions);
    return encodeRepeats(foldRuns(encode(clean, opts.extensions)));
}

Program lower(std::string_view source, const CompileOptions& opts, CompileStats* stats) {
    TokenStream tokens = tokenize(source, opts);
    if (opts.optimize) {
        ReductionCache cache;
        ReduceStats reduce;
        tokens = reduceLoops(tokens, &cache, &reduce);
        if (stats) {
            stats->loops = reduce.loops;
            stats->reducedLoops = reduce.reduced;
            stats->cacheHits = cache.hits();
        }
    }
    Program program = fuse(tokens, FuseOptions{opts.optimize});
    if (stats) stats->statements = program.size();
    return program;
}

std::string translate(std::string_view source, const CompileOptions& opts) {
    return emit(lower(source, opts), opts.extensions,
                EmitOptions{opts.shiftDivision, 1, opts.cellWidth});
}

std::string compile(std::string_view source, std::string_view input, const CompileOptions& opts,
                    CompileStats* stats) {
    const Program program = lower(source, opts, stats);
    const bool usesInput = std::any_of(program.begin(), program.end(), [](const Statement& s) {
        return s.kind == StmtKind::Input;
    });
    const std::string body =
        emit(program, opts.extensions, EmitOptions{opts.shiftDivision, 1, opts.cellWidth});
    return addPreamble(body, input,
                       PreambleOptions{opts.cellWidth, opts.tapeSize, opts.eof, usesInput},
                       opts.extensions);
}

}  // namespace tapec
