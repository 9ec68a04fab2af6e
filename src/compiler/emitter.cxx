/*
    Tapec - An optimizing tape language to C compiler
    C statement templates and runtime preamble
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "compiler/emitter.hxx"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace tapec {

namespace {
std::string cell(std::int64_t offset) { return "p[" + std::to_string(offset) + "]"; }

// `+= n` / `-= n`, with ++/-- for unit steps.
std::string addTo(const std::string& target, std::int64_t value) {
    if (value == 1) return "++" + target + ";";
    if (value == -1) return "--" + target + ";";
    if (value < 0) return target + " -= " + std::to_string(-value) + ";";
    return target + " += " + std::to_string(value) + ";";
}

std::string movePtr(std::int64_t move) {
    if (move == 1) return "++p;";
    if (move == -1) return "--p;";
    if (move < 0) return "p -= " + std::to_string(-move) + ";";
    return "p += " + std::to_string(move) + ";";
}

// Unsigned literal so the product wraps instead of overflowing a promoted int.
std::string unsignedLiteral(std::uint64_t v) {
    return std::to_string(v) + (v > UINT32_MAX ? "ull" : "u");
}

// Residue of v modulo 2^width.
std::uint64_t modWidth(std::uint64_t v, int width) {
    return width >= 64 ? v : v & ((std::uint64_t{1} << width) - 1);
}

// target += source * c, written as a subtraction when -c is the smaller residue.
std::string scaledAdd(const std::string& target, const std::string& source, std::uint64_t c,
                      int width) {
    const std::uint64_t neg = modWidth(0 - c, width);
    const bool minus = neg < c;
    const std::uint64_t mag = minus ? neg : c;
    const std::string term = mag == 1 ? source : source + " * " + unsignedLiteral(mag);
    return target + (minus ? " -= " : " += ") + term + ";";
}

std::string mulAdd(const Statement& s, const EmitOptions& opts) {
    const int width = opts.cellWidth;
    const std::uint32_t divisor = s.divisor ? s.divisor : 1;
    int k = std::countr_zero(divisor);
    const std::uint64_t inv = modWidth(oddInverse(divisor >> k), width);
    std::int64_t n = s.value;
    // The guard ahead of the fragments keeps the low k bits of the source clear, so common
    // powers of two cancel exactly.
    while (k > 0 && n != 0 && n % 2 == 0) {
        n /= 2;
        --k;
    }
    if (k == 0) {
        std::uint64_t c = static_cast<std::uint64_t>(n) * inv;
        if (s.negate) c = 0 - c;
        return scaledAdd(cell(s.offset), "p[0]", modWidth(c, width), width);
    }
    std::string source = s.negate ? "(cell_t)-p[0]" : "p[0]";
    if (inv != 1) source = "(cell_t)(" + source + " * " + unsignedLiteral(inv) + ")";
    const std::string iterations =
        opts.shiftDivision ? "(" + source + " >> " + std::to_string(k) + ")"
                           : source + " / " + unsignedLiteral(std::uint64_t{1} << k);
    return scaledAdd(cell(s.offset), iterations, modWidth(static_cast<std::uint64_t>(n), width),
                     width);
}
}  // namespace

std::string renderStatement(const Statement& s, const ExtensionSet& extensions,
                            const EmitOptions& opts) {
    switch (s.kind) {
        case StmtKind::AddAt:
            return addTo(cell(s.offset), s.value);
        case StmtKind::ClearAt:
            return cell(s.offset) + " = 0;";
        case StmtKind::AddThenMove:
            return addTo(cell(0), s.value) + " " + movePtr(s.move);
        case StmtKind::MoveThenAdd:
            return movePtr(s.move) + " " + addTo(cell(0), s.value);
        case StmtKind::MoveThenClear:
            return movePtr(s.move) + " p[0] = 0;";
        case StmtKind::Move:
            return movePtr(s.move);
        case StmtKind::MulAdd:
            return mulAdd(s, opts);
        case StmtKind::AddIfNonZero:
            return "if (p[0]) " + addTo(cell(s.offset), s.value);
        case StmtKind::ClearIfNonZero:
            return "if (p[0]) " + cell(s.offset) + " = 0;";
        case StmtKind::ScanRight:
            return "while (p[0]) ++p;";
        case StmtKind::ScanLeft:
            return "while (p[0]) --p;";
        case StmtKind::LoopBegin:
            return "while (p[0]) {";
        case StmtKind::LoopEnd:
            return "}";
        case StmtKind::Input:
            return "tapec_read(p);";
        case StmtKind::Output:
            return "putchar((unsigned char)p[0]);";
        case StmtKind::Extension:
            if (const Extension* ext = extensions.find(s.symbol)) return ext->statement;
            return std::string("/* unknown extension '") + s.symbol + "' */";
        case StmtKind::SpinUnlessMultiple:
            return "if (p[0] & " + unsignedLiteral(s.divisor - 1u) + ") for (;;) {}";
    }
    return {};
}

std::string emit(const Program& program, const ExtensionSet& extensions, const EmitOptions& opts) {
    std::string out;
    int depth = opts.indent;
    for (const auto& s : program) {
        if (s.kind == StmtKind::LoopEnd && depth > opts.indent) --depth;
        out.append(static_cast<std::size_t>(depth) * 4, ' ');
        out += renderStatement(s, extensions, opts);
        out += '\n';
        if (s.kind == StmtKind::LoopBegin) ++depth;
    }
    return out;
}

std::string inputInitializer(std::string_view input) {
    std::string init = "{";
    for (unsigned char c : input) {
        init += std::to_string(static_cast<unsigned>(c));
        init += ", ";
    }
    init += "0}";
    return init;
}

std::string addPreamble(std::string_view body, std::string_view input,
                        const PreambleOptions& opts, const ExtensionSet& extensions) {
    std::ostringstream out;
    out << "/* Generated by tapec */\n"
        << "#include <stdint.h>\n#include <stdio.h>\n#include <stdlib.h>\n#include <string.h>\n";
    for (const auto& h : extensions.headers()) out << "#include <" << h << ">\n";
    out << "\ntypedef uint" << opts.cellWidth << "_t cell_t;\n\n"
        << "#define TAPE_SIZE " << opts.tapeSize << "u\n"
        << "static cell_t tape[TAPE_SIZE];\n";
    if (opts.usesInput) {
        if (input.empty()) {
            out << "static unsigned char *in_buf = NULL;\n"
                << "static size_t in_len = 0;\n";
        } else {
            out << "static unsigned char in_init[] = " << inputInitializer(input) << ";\n"
                << "static unsigned char *in_buf = in_init;\n"
                << "static size_t in_len = sizeof in_init;\n";
        }
        out << "static size_t in_pos = 0;\n"
            << "static char in_line[65536];\n\n"
            << "static void tapec_read(cell_t *cell)\n{\n"
            << "    if (in_pos >= in_len) {\n"
            << "        if (!fgets(in_line, sizeof in_line, stdin)) {\n";
        switch (opts.eof) {
            case EofPolicy::Unchanged:
                out << "            return;\n";
                break;
            case EofPolicy::Zero:
                out << "            *cell = 0;\n            return;\n";
                break;
            case EofPolicy::Exit:
                out << "            fflush(stdout);\n            exit(0);\n";
                break;
        }
        out << "        }\n"
            << "        in_buf = (unsigned char *)in_line;\n"
            << "        in_len = strlen(in_line) + 1;\n"
            << "        in_pos = 0;\n"
            << "    }\n"
            << "    *cell = in_buf[in_pos++];\n"
            << "}\n";
    }
    out << "\nint main(void)\n{\n"
        << "    cell_t *p = tape + TAPE_SIZE / 2;\n"
        << "    (void)p;\n"
        << body << "    return 0;\n}\n";
    return out.str();
}

}  // namespace tapec
