#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "tapec.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Token stream exactly as the reducer sees it, without loop reduction.
inline tapec::TokenStream tokens(std::string_view code,
                                 const tapec::ExtensionSet& ext = tapec::ExtensionSet{}) {
    tapec::CompileOptions opts;
    opts.extensions = ext;
    return tapec::tokenize(code, opts);
}

// Lowers `code` and runs it on the executor. Reads past `input` come from `lines`.
template <typename CellT>
static std::string runCompiled(std::string_view code, std::vector<CellT>& cells, size_t& cellPtr,
                               const std::string& input = "",
                               tapec::EofPolicy eof = tapec::EofPolicy::Exit,
                               int* retOut = nullptr, const std::string& lines = "") {
    tapec::CompileOptions opts;
    opts.eof = eof;
    const tapec::Program program = tapec::lower(code, opts);
    std::istringstream src(lines);
    tapec::InputStream in(input, &src, eof);
    std::ostringstream out;
    int ret = tapec::execute<CellT>(program, cells, cellPtr, in, out);
    if (retOut) *retOut = ret;
    return out.str();
}

template <typename CellT>
static std::string runReference(std::string_view code, std::vector<CellT>& cells,
                                size_t& cellPtr, const std::string& input = "",
                                tapec::EofPolicy eof = tapec::EofPolicy::Exit,
                                int* retOut = nullptr, const std::string& lines = "") {
    std::istringstream src(lines);
    tapec::InputStream in(input, &src, eof);
    std::ostringstream out;
    int ret = tapec::interpret<CellT>(code, cells, cellPtr, in, out);
    if (retOut) *retOut = ret;
    return out.str();
}
