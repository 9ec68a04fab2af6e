#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "config.hxx"
#include "compiler/extensions.hxx"
#include "compiler/ir.hxx"

namespace tapec {

/// Drops every character outside the instruction alphabet and the enabled extensions.
std::string sanitize(std::string_view source, const ExtensionSet& extensions);

/// Maps sanitized text to tokens. The clear (`[-]`, `[+]`) and scan (`[<]`, `[>]`) idioms are
/// replaced left to right before the per-character mapping. Loops at the very start of the
/// program are removed together with their bodies since the tape is all zero there.
TokenStream encode(std::string_view sanitized, const ExtensionSet& extensions);

/// Collapses every maximal run of increments/decrements and of right/left moves to its net
/// effect, as `net` single tokens of the majority kind. Idempotent.
TokenStream foldRuns(const TokenStream& tokens);

/// Rewrites runs of two or more identical add/sub or move tokens into count-prefixed tokens of at
/// most `maxRepeat`; longer runs are split into successive tokens.
TokenStream encodeRepeats(const TokenStream& tokens, std::uint32_t maxRepeat = TAPEC_MAX_REPEAT);

/// Loop reductions memoized by body digest for the lifetime of one compilation.
class ReductionCache {
   public:
    const std::optional<Program>* find(const TokenStream& body) const;
    void store(const TokenStream& body, std::optional<Program> result);
    std::size_t size() const { return entries.size(); }
    std::size_t hits() const { return hitCount; }

   private:
    static std::uint64_t digest(const TokenStream& body);
    std::unordered_map<std::uint64_t, std::pair<TokenStream, std::optional<Program>>> entries;
    mutable std::size_t hitCount = 0;
};

/// Tries to replace one innermost loop body (the tokens between the brackets) by straight-line
/// fragments with zero net pointer displacement. Returns nullopt when the loop must stay a loop.
std::optional<Program> reduceLoop(const TokenStream& body);

struct ReduceStats {
    std::size_t loops = 0;    // innermost loops examined
    std::size_t reduced = 0;  // of which replaced by fragments
};

/// Replaces every reducible innermost loop of the stream by Fragment tokens. Loops containing
/// nested loop markers or fragments are left untouched.
TokenStream reduceLoops(const TokenStream& tokens, ReductionCache* cache = nullptr,
                        ReduceStats* stats = nullptr);

struct FuseOptions {
    bool fuse = true;  // false emits one statement per token
};

/// Turns the token stream into statements, fusing move/update neighbours where possible.
Program fuse(const TokenStream& tokens, const FuseOptions& opts = {});

}  // namespace tapec
