#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "config.hxx"
#include "compiler/extensions.hxx"
#include "compiler/ir.hxx"

namespace tapec {

struct EmitOptions {
    bool shiftDivision = true;  // power-of-two divisors become right shifts
    int indent = 1;             // nesting level of the first statement
    int cellWidth = TAPEC_DEFAULT_CELL_WIDTH;  // modulus of the emitted multipliers
};

/// C text of a single statement, without indentation or line break.
std::string renderStatement(const Statement& stmt, const ExtensionSet& extensions,
                            const EmitOptions& opts = {});

/// Renders statements one per line, indented by loop depth, in program order.
std::string emit(const Program& program, const ExtensionSet& extensions,
                 const EmitOptions& opts = {});

struct PreambleOptions {
    int cellWidth;
    std::size_t tapeSize;
    EofPolicy eof;
    bool usesInput;
};

/// Wraps an emitted body into a complete C translation unit: headers, cell type, the static
/// tape with the pointer at its middle, the literal input buffer and the read helper.
std::string addPreamble(std::string_view body, std::string_view input,
                        const PreambleOptions& opts, const ExtensionSet& extensions);

/// `{65, 66, 0}` style initializer for the literal input followed by its zero sentinel.
std::string inputInitializer(std::string_view input);

}  // namespace tapec
