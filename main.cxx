/*
    Tapec - An optimizing tape language to C compiler
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "cpp-terminal/color.hpp"
#include "tapec.hxx"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {
// Read-only mapping of a source file
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() { close(); }
    void close() {
        if (data && size) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
            munmap(const_cast<char*>(data), size);
        }
        if (fd >= 0) ::close(fd);
        data = nullptr;
        size = 0;
        fd = -1;
    }
};

bool mapFileReadOnly(const std::string& path, MappedFile& mf) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;
    struct stat st{};
    if (fstat(fd, &st) != 0) {
        ::close(fd);
        return false;
    }
    mf.fd = fd;
    if (st.st_size == 0) return true;
    void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
    if (view == MAP_FAILED) {
        mf.close();
        return false;
    }
    mf.data = static_cast<const char*>(view);
    mf.size = static_cast<size_t>(st.st_size);
    return true;
}

// Reads the source verbatim; sanitizing is the compiler's job since extensions widen the
// alphabet. On error, 'err' is set and 'out' left unchanged.
bool readSourceFile(const std::string& filename, std::string& out, std::string& err) {
    MappedFile mf;
    if (mapFileReadOnly(filename, mf)) {
        out.assign(mf.data ? mf.data : "", mf.size);
        return true;
    }
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened";
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!in.eof() && in.fail()) {
        err = "Error while reading file";
        return false;
    }
    out.swap(text);
    return true;
}

void printError(std::string_view msg) {
    std::cerr << Term::color_fg(Term::Color::Name::Red)
              << "ERROR:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg
              << std::endl;
}

void printWarning(std::string_view msg) {
    std::cerr << Term::color_fg(Term::Color::Name::Yellow)
              << "WARNING:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg
              << std::endl;
}

struct CmdArgs {
    std::string filename;
    std::string evalCode;
    std::string outFile;
    std::string input;
    bool run = false;
    bool dumpMemory = false;
    bool help = false;
    bool optimize = true;
    bool shiftDivision = true;
    bool fork = false;
    bool profile = false;
    int eof = TAPEC_DEFAULT_EOF_POLICY;
    std::size_t tapeSize = TAPEC_DEFAULT_TAPE_SIZE;
    int cellWidth = TAPEC_DEFAULT_CELL_WIDTH;
};

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-e" && i + 1 < argc) {
            args.evalCode = argv[++i];
            args.filename.clear();
        } else if (arg == "-i" && i + 1 < argc && args.evalCode.empty()) {
            args.filename = argv[++i];
        } else if (arg == "-o" && i + 1 < argc) {
            args.outFile = argv[++i];
        } else if (arg == "-in" && i + 1 < argc) {
            args.input = argv[++i];
        } else if (arg == "-run") {
            args.run = true;
        } else if (arg == "-dm") {
            args.dumpMemory = true;
        } else if (arg == "-h") {
            args.help = true;
        } else if (arg == "-nopt") {
            args.optimize = false;
        } else if (arg == "-noshift") {
            args.shiftDivision = false;
        } else if (arg == "-fork") {
            args.fork = true;
        } else if (arg == "-eof" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            long parsed = std::strtol(val, &end, 10);
            if (end == val || *end != '\0' || parsed < 0 || parsed > 2) {
                printError(std::string("Invalid EOF policy: ") + val);
                args.help = true;
            } else {
                args.eof = static_cast<int>(parsed);
            }
        } else if (arg == "-ts" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            unsigned long long parsed = std::strtoull(val, &end, 10);
            if (val[0] == '-' || end == val || *end != '\0' || parsed == 0) {
                printError(std::string("Tape size must be a positive integer: ") + val);
                args.help = true;
            } else {
                args.tapeSize = static_cast<std::size_t>(parsed);
            }
        } else if (arg == "-cw" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            long parsed = std::strtol(val, &end, 10);
            if (end == val || *end != '\0' || parsed <= 0) {
                printError(std::string("Cell width must be a positive integer: ") + val);
                args.help = true;
            } else {
                args.cellWidth = static_cast<int>(parsed);
            }
        } else if (arg == "--profile") {
            args.profile = true;
        } else {
            printWarning(std::string("Ignoring unknown option ") + std::string(arg));
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -e <code>        Compile code given on the command line\n"
              << "  -i <file>        Compile code from file\n"
              << "  -o <file>        Write the generated C program to file (default stdout)\n"
              << "  -in <text>       Literal input buffer for the program\n"
              << "  -run             Execute the program instead of emitting C\n"
              << "  -nopt            Disable loop reduction and fusion\n"
              << "  -noshift         Divide instead of shifting for power-of-two divisors\n"
              << "  -eof <policy>    Input exhaustion: 0 unchanged, 1 zero, 2 exit (default)\n"
              << "  -ts <size>       Tape size in cells (default " << TAPEC_DEFAULT_TAPE_SIZE
              << ")\n"
              << "  -cw <width>      Cell width in bits (8,16,32,64)\n"
              << "  -fork            Enable the 'Y' process-fork instruction\n"
              << "  -dm              Dump memory after -run\n"
              << "  --profile        Print compilation and execution statistics\n"
              << "  -h               Show this help message" << std::endl;
}

template <typename CellT>
void dumpMemory(const std::vector<CellT>& cells, size_t cellPtr) {
    if (cells.empty()) {
        std::cout << "Memory dump:\n<empty>" << std::endl;
        return;
    }
    size_t first = cellPtr, last = cellPtr;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (!cells[i]) continue;
        first = std::min(first, i);
        last = std::max(last, i);
    }
    std::cout << "Memory dump (from cell " << first << "):" << std::endl;
    for (size_t i = first, col = 0; i <= last; ++i, ++col) {
        if (i == cellPtr) std::cout << '[';
        std::cout << +cells[i];
        if (i == cellPtr) std::cout << ']';
        std::cout << (col % 10 == 9 ? '\n' : ' ');
    }
    if ((last - first) % 10 != 9) std::cout << std::endl;
}

template <typename CellT>
int runProgram(const CmdArgs& args, const std::string& code, const tapec::CompileOptions& opts) {
    std::vector<CellT> cells(args.tapeSize, 0);
    size_t cellPtr = args.tapeSize / 2;
    tapec::InputStream in(args.input, &std::cin, opts.eof);
    tapec::Profile prof;
    tapec::Profile* profPtr = args.profile ? &prof : nullptr;
    int ret;
    if (args.optimize) {
        tapec::CompileStats stats;
        const tapec::Program program = tapec::lower(code, opts, &stats);
        ret = tapec::execute<CellT>(program, cells, cellPtr, in, std::cout, profPtr);
        if (args.profile) {
            std::cerr << "Loops reduced: " << stats.reducedLoops << '/' << stats.loops
                      << std::endl;
        }
    } else {
        ret = tapec::interpret<CellT>(code, cells, cellPtr, in, std::cout, profPtr);
    }
    std::cout.flush();
    if (args.dumpMemory) dumpMemory<CellT>(cells, cellPtr);
    if (args.profile) {
        std::cerr << "Statements executed: " << prof.statements << std::endl;
        std::cerr << "Elapsed time: " << prof.seconds << "s" << std::endl;
    }
    return ret == tapec::kOutOfBounds ? 1 : 0;
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs args = parseArgs(argc, argv);
    if (args.help) {
        printHelp(argv[0]);
        return 0;
    }
    if (args.cellWidth != 8 && args.cellWidth != 16 && args.cellWidth != 32 &&
        args.cellWidth != 64) {
        printError("Unsupported cell width; use 8,16,32,64");
        return 1;
    }
    const std::size_t widthBytes = static_cast<std::size_t>(args.cellWidth / 8);
    if (args.tapeSize > (TAPEC_TAPE_MAX_BYTES / widthBytes)) {
        printError("Requested tape exceeds maximum allowed size (" +
                   std::to_string(TAPEC_TAPE_MAX_BYTES >> 20) + " MiB)");
        return 1;
    }
    if (args.tapeSize * widthBytes > TAPEC_TAPE_WARN_BYTES) {
        printWarning("Tape allocation ~" + std::to_string((args.tapeSize * widthBytes) >> 20) +
                     " MiB may exceed system memory");
    }
    if (args.filename.empty() && args.evalCode.empty()) {
        std::cout << "No program given; use -i <file> or -e <code>" << std::endl;
        return 0;
    }
    std::string code;
    if (!args.evalCode.empty()) {
        code = args.evalCode;
    } else {
        std::string err;
        if (!readSourceFile(args.filename, code, err)) {
            printError(err);
            return 1;
        }
    }
    switch (tapec::checkBrackets(code)) {
        case 1:
            printError("Unmatched close bracket");
            return 1;
        case 2:
            printError("Unmatched open bracket");
            return 1;
    }

    tapec::CompileOptions opts;
    opts.cellWidth = args.cellWidth;
    opts.tapeSize = args.tapeSize;
    opts.eof = static_cast<tapec::EofPolicy>(args.eof);
    opts.optimize = args.optimize;
    opts.shiftDivision = args.shiftDivision;
    if (args.fork) opts.extensions.add(tapec::kForkSymbol, tapec::forkExtension());

    if (args.run) {
        if (args.fork && code.find(tapec::kForkSymbol) != std::string::npos) {
            printWarning("'Y' only forks in the generated C program; -run treats it as a no-op");
        }
        switch (args.cellWidth) {
            case 8:
                return runProgram<uint8_t>(args, code, opts);
            case 16:
                return runProgram<uint16_t>(args, code, opts);
            case 32:
                return runProgram<uint32_t>(args, code, opts);
            case 64:
                return runProgram<uint64_t>(args, code, opts);
            default:
                printError("Unsupported cell width; use 8,16,32,64");
                return 1;
        }
    }
    tapec::CompileStats stats;
    const std::string program = tapec::compile(code, args.input, opts, &stats);
    if (args.outFile.empty()) {
        std::cout << program;
    } else {
        std::ofstream out(args.outFile, std::ios::binary);
        if (!out || !(out << program)) {
            printError("Could not write " + args.outFile);
            return 1;
        }
    }
    if (args.profile) {
        std::cerr << "Loops reduced: " << stats.reducedLoops << '/' << stats.loops
                  << " (cache hits " << stats.cacheHits << ")" << std::endl;
        std::cerr << "Statements emitted: " << stats.statements << std::endl;
    }
    return 0;
}
