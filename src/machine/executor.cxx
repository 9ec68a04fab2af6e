/*
    Tapec - An optimizing tape language to C compiler
    Direct execution of lowered programs
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "machine/executor.hxx"

#include <bit>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <vector>

#include "scan.hxx"

namespace tapec {

namespace {
template <typename CellT>
inline CellT wrapAdd(CellT cell, std::int64_t delta) {
    return static_cast<CellT>(static_cast<std::uint64_t>(cell) + static_cast<std::uint64_t>(delta));
}

// Number of iterations a reduced loop stands for, times its per-iteration coefficient. With
// divisor = 2^k * m the count is (source * m^-1 mod 2^N) >> k; the guard in front of the
// fragments has already ruled out sources with low bits set.
template <typename CellT>
inline std::uint64_t mulAddTerm(CellT origin, const Statement& s) {
    const CellT source =
        s.negate ? static_cast<CellT>(0 - static_cast<std::uint64_t>(origin)) : origin;
    const std::uint32_t divisor = s.divisor ? s.divisor : 1;
    const int k = std::countr_zero(divisor);
    const auto scaled =
        static_cast<CellT>(static_cast<std::uint64_t>(source) * oddInverse(divisor >> k));
    const std::uint64_t iterations = static_cast<std::uint64_t>(scaled) >> k;
    return iterations * static_cast<std::uint64_t>(s.value);
}
}  // namespace

template <typename CellT>
int execute(const Program& program, std::vector<CellT>& cells, std::size_t& cellPtr,
            InputStream& in, std::ostream& out, Profile* profile) {
    std::vector<std::size_t> partner(program.size());
    {
        std::vector<std::size_t> stack;
        for (std::size_t i = 0; i < program.size(); ++i) {
            if (program[i].kind == StmtKind::LoopBegin) {
                stack.push_back(i);
            } else if (program[i].kind == StmtKind::LoopEnd) {
                if (stack.empty()) return kUnmatchedClose;
                partner[stack.back()] = i;
                partner[i] = stack.back();
                stack.pop_back();
            }
        }
        if (!stack.empty()) return kUnmatchedOpen;
    }

    static void* jtable[] = {&&_ADD_AT,      &&_CLEAR_AT,   &&_ADD_THEN_MOVE, &&_MOVE_THEN_ADD,
                             &&_MOVE_THEN_CLR, &&_MOVE,     &&_MUL_ADD,       &&_ADD_IF,
                             &&_CLEAR_IF,    &&_SCN_RGT,    &&_SCN_LFT,       &&_LOOP_BEGIN,
                             &&_LOOP_END,    &&_RAD_CHR,    &&_PUT_CHR,       &&_EXTENSION,
                             &&_SPIN};
    std::vector<void*> targets;
    targets.reserve(program.size() + 1);
    for (const auto& s : program) targets.push_back(jtable[static_cast<std::size_t>(s.kind)]);
    targets.push_back(&&_END);

    const auto size = static_cast<std::ptrdiff_t>(cells.size());
    auto pos = static_cast<std::ptrdiff_t>(cellPtr);
    if (pos >= size) return kOutOfBounds;
    CellT* const tape = cells.data();
    std::size_t pc = 0;
    int status = kRunOk;
    std::chrono::steady_clock::time_point start;
    if (profile) {
        profile->statements = 0;
        start = std::chrono::steady_clock::now();
    }

#define DISPATCH() goto* targets[pc]
#define LOOP()                                \
    do {                                      \
        if (profile) ++profile->statements;   \
        ++pc;                                 \
        DISPATCH();                           \
    } while (0)
#define CHECK(idx)                                \
    if ((idx) < 0 || (idx) >= size) [[unlikely]] \
        goto _OUT_OF_BOUNDS

    DISPATCH();

_ADD_AT: {
    const Statement& s = program[pc];
    const std::ptrdiff_t idx = pos + s.offset;
    CHECK(idx);
    tape[idx] = wrapAdd(tape[idx], s.value);
    LOOP();
}

_CLEAR_AT: {
    const std::ptrdiff_t idx = pos + program[pc].offset;
    CHECK(idx);
    tape[idx] = 0;
    LOOP();
}

_ADD_THEN_MOVE: {
    const Statement& s = program[pc];
    tape[pos] = wrapAdd(tape[pos], s.value);
    pos += s.move;
    CHECK(pos);
    LOOP();
}

_MOVE_THEN_ADD: {
    const Statement& s = program[pc];
    pos += s.move;
    CHECK(pos);
    tape[pos] = wrapAdd(tape[pos], s.value);
    LOOP();
}

_MOVE_THEN_CLR:
    pos += program[pc].move;
    CHECK(pos);
    tape[pos] = 0;
    LOOP();

_MOVE:
    pos += program[pc].move;
    CHECK(pos);
    LOOP();

_MUL_ADD: {
    const Statement& s = program[pc];
    const std::ptrdiff_t idx = pos + s.offset;
    CHECK(idx);
    tape[idx] = static_cast<CellT>(static_cast<std::uint64_t>(tape[idx]) +
                                   mulAddTerm<CellT>(tape[pos], s));
    LOOP();
}

_ADD_IF:
    if (tape[pos]) {
        const Statement& s = program[pc];
        const std::ptrdiff_t idx = pos + s.offset;
        CHECK(idx);
        tape[idx] = wrapAdd(tape[idx], s.value);
    }
    LOOP();

_CLEAR_IF:
    if (tape[pos]) {
        const std::ptrdiff_t idx = pos + program[pc].offset;
        CHECK(idx);
        tape[idx] = 0;
    }
    LOOP();

_SCN_RGT:
    pos += static_cast<std::ptrdiff_t>(
        scan::forward<CellT>(tape + pos, static_cast<std::size_t>(size - pos)));
    CHECK(pos);
    LOOP();

_SCN_LFT:
    pos -= static_cast<std::ptrdiff_t>(scan::backward<CellT>(tape, static_cast<std::size_t>(pos)));
    CHECK(pos);
    LOOP();

_LOOP_BEGIN:
    if (!tape[pos]) pc = partner[pc];
    LOOP();

_LOOP_END:
    if (tape[pos]) pc = partner[pc];
    LOOP();

_RAD_CHR: {
    const int c = in.next();
    if (c >= 0) {
        tape[pos] = static_cast<CellT>(c);
    } else if (in.policy() == EofPolicy::Zero) {
        tape[pos] = 0;
    } else if (in.policy() == EofPolicy::Exit) {
        out.flush();
        status = kInputExit;
        goto _END;
    }
    LOOP();
}

_PUT_CHR:
    out.put(static_cast<char>(tape[pos]));
    LOOP();

_EXTENSION:
    LOOP();

_SPIN: {
    // The source loop never reaches zero from here.
    const volatile CellT* origin = tape + pos;
    const std::uint64_t mask = program[pc].divisor - std::uint64_t{1};
    while (static_cast<std::uint64_t>(*origin) & mask) {
    }
    LOOP();
}

_OUT_OF_BOUNDS:
    std::cerr << "cell pointer moved outside the tape" << std::endl;
    status = kOutOfBounds;
    pos = pos < 0 ? 0 : (pos >= size ? size - 1 : pos);

_END:
#undef CHECK
#undef LOOP
#undef DISPATCH
    cellPtr = static_cast<std::size_t>(pos);
    if (profile)
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return status;
}

template int execute<std::uint8_t>(const Program&, std::vector<std::uint8_t>&, std::size_t&,
                                   InputStream&, std::ostream&, Profile*);
template int execute<std::uint16_t>(const Program&, std::vector<std::uint16_t>&, std::size_t&,
                                    InputStream&, std::ostream&, Profile*);
template int execute<std::uint32_t>(const Program&, std::vector<std::uint32_t>&, std::size_t&,
                                    InputStream&, std::ostream&, Profile*);
template int execute<std::uint64_t>(const Program&, std::vector<std::uint64_t>&, std::size_t&,
                                    InputStream&, std::ostream&, Profile*);

}  // namespace tapec
