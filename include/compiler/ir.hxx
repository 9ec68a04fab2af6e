#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tapec {

enum class OpKind : std::uint8_t {
    IncCell,
    DecCell,
    ClearCell,
    MoveRight,
    MoveLeft,
    LoopOpen,
    LoopClose,
    ScanRight,
    ScanLeft,
    Input,
    Output,
    Extension,
    Fragment,
};

enum class StmtKind : std::uint8_t {
    AddAt,           // cell[offset] += value
    ClearAt,         // cell[offset] = 0
    AddThenMove,     // cell[0] += value; ptr += move
    MoveThenAdd,     // ptr += move; cell[0] += value
    MoveThenClear,   // ptr += move; cell[0] = 0
    Move,            // ptr += move
    MulAdd,          // cell[offset] += iterations(±cell[0], divisor) * value
    AddIfNonZero,    // if (cell[0]) cell[offset] += value
    ClearIfNonZero,  // if (cell[0]) cell[offset] = 0
    ScanRight,
    ScanLeft,
    LoopBegin,
    LoopEnd,
    Input,
    Output,
    Extension,
    SpinUnlessMultiple,  // never returns unless cell[0] is a multiple of divisor (a power of two)
};

/// One emitted statement. Fields that a kind does not use stay at their defaults.
/// For MulAdd, `negate` selects the two's complement of the origin cell as the source term
/// (origin counts upwards to wraparound) and `divisor` is the per-iteration origin step. With
/// divisor = 2^k * m, m odd, a loop over an N-bit cell runs ((source * m^-1) mod 2^N) >> k times;
/// a SpinUnlessMultiple guard ahead of the fragments covers sources with any of the low k bits set.
struct Statement {
    StmtKind kind = StmtKind::Move;
    std::int32_t offset = 0;
    std::int64_t value = 0;
    std::int32_t move = 0;
    std::uint32_t divisor = 1;
    bool negate = false;
    char symbol = 0;

    bool operator==(const Statement&) const = default;
};

using Program = std::vector<Statement>;

struct Token {
    OpKind kind = OpKind::IncCell;
    std::uint32_t count = 1;
    char symbol = 0;  // Extension symbol
    Statement fragment{};

    bool operator==(const Token&) const = default;
};

using TokenStream = std::vector<Token>;

/// What a read does once the literal input and the line source are both exhausted.
enum class EofPolicy : std::uint8_t { Unchanged = 0, Zero = 1, Exit = 2 };

inline bool isValueOp(OpKind k) { return k == OpKind::IncCell || k == OpKind::DecCell; }
inline bool isMoveOp(OpKind k) { return k == OpKind::MoveRight || k == OpKind::MoveLeft; }
inline bool isLoopMarker(OpKind k) { return k == OpKind::LoopOpen || k == OpKind::LoopClose; }

/// Signed magnitude of an add/sub or move token: right and increment are positive.
inline std::int64_t signedCount(const Token& t) {
    const auto c = static_cast<std::int64_t>(t.count);
    return (t.kind == OpKind::DecCell || t.kind == OpKind::MoveLeft) ? -c : c;
}

/// Multiplicative inverse of an odd `m` modulo 2^64, hence modulo every smaller power of two.
constexpr std::uint64_t oddInverse(std::uint64_t m) {
    std::uint64_t x = m;  // correct to 3 bits
    for (int i = 0; i < 5; ++i) x *= 2 - m * x;
    return x;
}

/// Sum of token counts, i.e. the number of source instructions a stream stands for.
std::size_t expandedLength(const TokenStream& tokens);

/// Debug spelling of a token stream: counts as decimal prefixes, opcodes as source symbols,
/// idioms as `c`, `l`, `r` and reduced fragments as `F`.
std::string spell(const TokenStream& tokens);

}  // namespace tapec
