#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "config.hxx"
#include "compiler/ir.hxx"

namespace tapec {

// Return codes shared by execute() and interpret().
inline constexpr int kRunOk = 0;
inline constexpr int kUnmatchedClose = 1;
inline constexpr int kUnmatchedOpen = 2;
inline constexpr int kInputExit = 3;
inline constexpr int kOutOfBounds = -1;

struct Profile {
    std::uint64_t statements = 0;
    double seconds = 0.0;
};

/// Input side of the runtime contract: the literal buffer (followed by a zero sentinel) is
/// consumed first; once exhausted one line at a time is pulled from `lines`, again followed by a
/// zero sentinel. Mirrors `tapec_read()` in the generated preamble.
class InputStream {
   public:
    static constexpr std::size_t kLineMax = 65536;

    explicit InputStream(std::string_view literal = {}, std::istream* lines = nullptr,
                         EofPolicy eof = static_cast<EofPolicy>(TAPEC_DEFAULT_EOF_POLICY));

    /// Next byte, or -1 when both the buffer and the line source are exhausted.
    int next();
    EofPolicy policy() const { return eof; }

   private:
    bool refill();

    std::string buffer;
    std::size_t cursor = 0;
    std::istream* lines;
    EofPolicy eof;
};

/// @brief Runs a lowered program directly on a tape.
/// @tparam CellT Cell width type (uint8_t, uint16_t, uint32_t, uint64_t)
/// @param program Statements as produced by lower().
/// @param cells Tape. Its size is fixed for the run.
/// @param cellPtr Start position on entry, final position on return.
/// @param in Input source; its policy decides what a read past the end does.
/// @param out Receives one byte per output statement.
/// @param profile Optional statement count and wall time.
/// @return kRunOk, kInputExit, kOutOfBounds or a bracket code for unmatched loop statements.
template <typename CellT>
int execute(const Program& program, std::vector<CellT>& cells, std::size_t& cellPtr,
            InputStream& in, std::ostream& out, Profile* profile = nullptr);

/// Naive per-instruction interpreter over the same contract. Characters outside the core
/// alphabet, extension symbols included, are ignored.
template <typename CellT>
int interpret(std::string_view source, std::vector<CellT>& cells, std::size_t& cellPtr,
              InputStream& in, std::ostream& out, Profile* profile = nullptr);

}  // namespace tapec
