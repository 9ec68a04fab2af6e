#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tapec {

struct Extension {
    std::string statement;             // C statement emitted for each occurrence
    std::vector<std::string> headers;  // extra system headers the statement needs
};

/// Opcode extensions enabled for one compilation. Registering a symbol widens the accepted
/// alphabet and supplies the emitter template for it.
class ExtensionSet {
   public:
    /// Returns false when `symbol` is a core instruction or already registered.
    bool add(char symbol, Extension ext);
    bool contains(char symbol) const { return table.count(symbol) != 0; }
    const Extension* find(char symbol) const;
    bool empty() const { return table.empty(); }

    /// Union of the headers every registered extension requires, without duplicates.
    std::vector<std::string> headers() const;

   private:
    std::map<char, Extension> table;
};

bool isCoreSymbol(char c);

/// Process-spawn extension: `fork()` splits execution, the child observes the current cell as 0
/// and the parent as 1.
constexpr char kForkSymbol = 'Y';
Extension forkExtension();

}  // namespace tapec
