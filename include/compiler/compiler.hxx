#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "config.hxx"
#include "compiler/extensions.hxx"
#include "compiler/ir.hxx"

namespace tapec {

struct CompileOptions {
    int cellWidth = TAPEC_DEFAULT_CELL_WIDTH;
    std::size_t tapeSize = TAPEC_DEFAULT_TAPE_SIZE;
    EofPolicy eof = static_cast<EofPolicy>(TAPEC_DEFAULT_EOF_POLICY);
    bool optimize = TAPEC_OPTIMIZE;  // loop reduction and peephole fusion
    bool shiftDivision = true;
    ExtensionSet extensions{};
};

struct CompileStats {
    std::size_t loops = 0;         // innermost loops seen by the reducer
    std::size_t reducedLoops = 0;  // of which replaced by straight-line code
    std::size_t cacheHits = 0;
    std::size_t statements = 0;
};

/// 0 when brackets balance, 1 on an unmatched `]`, 2 on an unmatched `[`.
/// Extension symbols and other characters are ignored.
int checkBrackets(std::string_view source);

/// Sanitize, encode, fold and repeat-encode.
TokenStream tokenize(std::string_view source, const CompileOptions& opts);

/// Full pipeline down to statements. Never fails; unbalanced brackets give unbalanced output.
Program lower(std::string_view source, const CompileOptions& opts,
              CompileStats* stats = nullptr);

/// Statement text only, without the runtime preamble.
std::string translate(std::string_view source, const CompileOptions& opts);

/// Complete C program for `source` with `input` as the literal input buffer.
std::string compile(std::string_view source, std::string_view input = {},
                    const CompileOptions& opts = {}, CompileStats* stats = nullptr);

}  // namespace tapec
