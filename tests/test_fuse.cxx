#include <cassert>
#include <string>

#include "helpers.hxx"

using namespace tapec;

static Program fused(const std::string& code, bool fuseOn = true) {
    return fuse(tokens(code), FuseOptions{fuseOn});
}

static void test_offset_update() {
    assert(fused(">>+<<") == (Program{{StmtKind::AddAt, 2, 1}}));
    assert(fused("<<<---->>>") == (Program{{StmtKind::AddAt, -3, -4}}));
    assert(fused("<[-]>") == (Program{{StmtKind::ClearAt, -1}}));
    // Unequal distances fall through to the advance forms.
    assert(fused(">>+<") == (Program{{StmtKind::MoveThenAdd, 0, 1, 2}, {StmtKind::Move, 0, 0, -1}}));
}

static void test_update_advance() {
    assert(fused("++>") == (Program{{StmtKind::AddThenMove, 0, 2, 1}}));
    assert(fused("-<") == (Program{{StmtKind::AddThenMove, 0, -1, -1}}));
    // Only single steps fuse.
    assert(fused("++>>") == (Program{{StmtKind::AddAt, 0, 2}, {StmtKind::Move, 0, 0, 2}}));
    assert(fused("+>+<") ==
           (Program{{StmtKind::AddThenMove, 0, 1, 1}, {StmtKind::AddThenMove, 0, 1, -1}}));
}

static void test_advance_update() {
    assert(fused(">>>-") == (Program{{StmtKind::MoveThenAdd, 0, -1, 3}}));
    assert(fused("<<[-]") == (Program{{StmtKind::MoveThenClear, 0, 0, -2}}));
    // The offset form wins over advancing.
    assert(fused(">+<") == (Program{{StmtKind::AddAt, 1, 1}}));
}

static void test_singles() {
    const Program p = fused("+[.,>]<[<]");
    const Program expected{{StmtKind::AddAt, 0, 1},     {StmtKind::LoopBegin},
                           {StmtKind::Output},          {StmtKind::Input},
                           {StmtKind::Move, 0, 0, 1},   {StmtKind::LoopEnd},
                           {StmtKind::Move, 0, 0, -1},  {StmtKind::ScanLeft}};
    assert(p == expected);

    ExtensionSet fork;
    fork.add(kForkSymbol, forkExtension());
    const Program ext = fuse(tokens("Y", fork));
    assert(ext.size() == 1);
    assert(ext[0].kind == StmtKind::Extension && ext[0].symbol == 'Y');

    Token frag{OpKind::Fragment};
    frag.fragment = Statement{StmtKind::AddIfNonZero, 2, 5};
    const Program opaque = fuse(TokenStream{Token{OpKind::MoveRight}, frag, Token{OpKind::MoveLeft}});
    assert(opaque.size() == 3);
    assert(opaque[1] == frag.fragment);
}

static void test_disabled() {
    assert(fused(">>+<<", false) == (Program{{StmtKind::Move, 0, 0, 2},
                                             {StmtKind::AddAt, 0, 1},
                                             {StmtKind::Move, 0, 0, -2}}));
}

int main() {
    test_offset_update();
    test_update_advance();
    test_advance_update();
    test_singles();
    test_disabled();
    return 0;
}
