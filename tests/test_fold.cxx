#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "helpers.hxx"

using namespace tapec;

static TokenStream folded(const std::string& code) {
    ExtensionSet none;
    return foldRuns(encode(sanitize(code, none), none));
}

static void test_net_effect() {
    assert(spell(folded("++-+>><<<")) == "++<");
    assert(spell(folded("+-")).empty());
    assert(spell(folded("><><")).empty());
    assert(spell(folded("---+")) == "--");
    // The value axis never mixes with the pointer axis.
    assert(spell(folded("+>-")) == "+>-");
    assert(spell(folded("+.-")) == "+.-");
    assert(spell(folded("+[-+>]")) == "+[>]");
}

static void test_idempotence() {
    const char* programs[] = {
        "++-+>><<<",
        "+[->+<]>>>-<<+.",
        "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++.",
        ",[.,]",
        "+-+-><><[-][+]",
    };
    for (const char* p : programs) {
        const TokenStream once = folded(p);
        assert(foldRuns(once) == once);
    }
}

static void test_repeat_encoding() {
    assert(spell(encodeRepeats(folded("+++>."))) == "3+>.");
    assert(spell(encodeRepeats(folded("+>>>>-"))) == "+4>-");
    assert(spell(encodeRepeats(folded("[-][-]"))) == "cc");

    // Chunk boundaries around the cap.
    for (std::size_t n = 2; n <= 3 * TAPEC_MAX_REPEAT + 5; ++n) {
        const TokenStream enc = encodeRepeats(folded(std::string(n, '<')));
        assert(expandedLength(enc) == n);
        assert(enc.size() == (n + TAPEC_MAX_REPEAT - 1) / TAPEC_MAX_REPEAT);
        for (std::size_t i = 0; i < enc.size(); ++i) {
            assert(enc[i].kind == OpKind::MoveLeft);
            if (i + 1 < enc.size()) assert(enc[i].count == TAPEC_MAX_REPEAT);
            assert(enc[i].count >= 1 && enc[i].count <= TAPEC_MAX_REPEAT);
        }
    }

    const TokenStream small = encodeRepeats(folded(std::string(10, '+')), 4);
    assert(spell(small) == "4+4+2+");
}

int main() {
    test_net_effect();
    test_idempotence();
    test_repeat_encoding();
    return 0;
}
