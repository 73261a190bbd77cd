#include "Check.hpp"
#include "../src/core/Stone.hpp"

using namespace tumble;

static void test_only_ordinary_and_wild_are_removable() {
    CHECK(!isRemovable(NoStone{}));
    CHECK(isRemovable(OrdinaryStone{ 'R', 1 }));
    CHECK(!isRemovable(SurvivorStone{}));
    CHECK(isRemovable(WildStone{}));
    CHECK(!isRemovable(ToggleStone{ 0 }));
    CHECK(!isRemovable(ToggleStone{ 1 }));
}

static void test_for_turn_advances_toggle_phase_only() {
    Stone t = forTurn(ToggleStone{ 1 }, 1);
    CHECK(std::get<ToggleStone>(t).phase == 2);
    CHECK(std::get<ToggleStone>(t).isOpen());
    CHECK(!std::get<ToggleStone>(forTurn(ToggleStone{ 0 }, 3)).isOpen());

    Stone o = OrdinaryStone{ 'G', 4 };
    CHECK(forTurn(o, 7) == o);
    CHECK(forTurn(WildStone{}, 5) == Stone(WildStone{}));
    CHECK(forTurn(SurvivorStone{}, 5) == Stone(SurvivorStone{}));
}

static void test_glyphs() {
    CHECK(glyphOf(NoStone{}) == ' ');
    CHECK(glyphOf(OrdinaryStone{ 'Q', 1 }) == 'Q');
    CHECK(glyphOf(SurvivorStone{}) == '@');
    CHECK(glyphOf(WildStone{}) == '*');
    CHECK(glyphOf(ToggleStone{ 0 }) == 'O');
    CHECK(glyphOf(ToggleStone{ 3 }) == 'X');
}

static void test_color_of() {
    CHECK(colorOf(OrdinaryStone{ 'A', 8 }) == 8);
    CHECK(colorOf(WildStone{}) == kWildcard);
    CHECK(colorOf(ToggleStone{ 1 }) == kWildcard);
}

static void test_bit_helpers() {
    CHECK(popCount(0) == 0);
    CHECK(popCount(0x80000001u) == 2);
    CHECK(bitIndex(0) == -1);
    CHECK(bitIndex(1) == 0);
    CHECK(bitIndex(0x80000000u) == 31);
}

int main() {
    test_only_ordinary_and_wild_are_removable();
    test_for_turn_advances_toggle_phase_only();
    test_glyphs();
    test_color_of();
    test_bit_helpers();
    std::cout << "test_stone: ok" << std::endl;
    return 0;
}
