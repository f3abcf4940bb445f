#include <doctest/doctest.h>
#include "GridBoard.h"

TEST_CASE("Board/ClicksAlternateStartAndEnd") {
    GridBoard board(4, 4);
    CHECK(board.getClickStage() == GridBoard::ClickStage::PickStart);

    CHECK(board.selectCell(0, 0));
    CHECK(board.getClickStage() == GridBoard::ClickStage::PickEnd);
    CHECK(board.selectCell(3, 2));
    CHECK(board.getClickStage() == GridBoard::ClickStage::PickStart);

    REQUIRE(board.getStartCell());
    REQUIRE(board.getEndCell());
    CHECK(*board.getStartCell() == GridCell{0, 0});
    CHECK(*board.getEndCell() == GridCell{3, 2});

    // third click starts over with a new start, the end stays
    CHECK(board.selectCell(1, 1));
    CHECK(*board.getStartCell() == GridCell{1, 1});
    CHECK(*board.getEndCell() == GridCell{3, 2});
}

TEST_CASE("Board/BlockedOrOutsideCellsCannotBeSelected") {
    GridBoard board(4, 4);
    board.toggleBlock(2, 2);

    CHECK_FALSE(board.selectCell(2, 2));
    CHECK_FALSE(board.selectCell(7, 0));
    CHECK(board.getClickStage() == GridBoard::ClickStage::PickStart);
    CHECK_FALSE(board.getStartCell());
    CHECK_FALSE(board.setEndCell(GridCell{2, 2}));
}

TEST_CASE("Board/BlockOnEndpointClearsIt") {
    GridBoard board(4, 4);
    board.setStartCell(GridCell{0, 0});
    board.setEndCell(GridCell{3, 3});

    CHECK(board.toggleBlock(3, 3));
    CHECK(board.getGrid().isBlocked(3, 3));
    CHECK_FALSE(board.getEndCell());
    CHECK(board.getStartCell());

    // removing the block again does not bring the endpoint back
    CHECK(board.toggleBlock(3, 3));
    CHECK_FALSE(board.getGrid().isBlocked(3, 3));
    CHECK_FALSE(board.getEndCell());

    CHECK_FALSE(board.toggleBlock(-1, 0));
}

TEST_CASE("Board/RandomizeKeepsARoute") {
    GridBoard board(20, 20);
    board.setStartCell(GridCell{0, 0});
    board.setEndCell(GridCell{19, 19});

    REQUIRE(board.randomizeBlocksEnsuringPath(0.35f, 200, 42u));
    CHECK(board.hasPath());
    CHECK(board.getGrid().countBlocked() > 0);
    CHECK_FALSE(board.getGrid().isBlocked(0, 0));
    CHECK_FALSE(board.getGrid().isBlocked(19, 19));
}

TEST_CASE("Board/RandomizeIsReproducibleWithASeed") {
    GridBoard a(12, 9);
    GridBoard b(12, 9);
    for (GridBoard* board : {&a, &b}) {
        board->setStartCell(GridCell{0, 4});
        board->setEndCell(GridCell{11, 4});
        REQUIRE(board->randomizeBlocksEnsuringPath(0.3f, 200, 2024u));
    }

    for (int i = 0; i < a.getGrid().getCellCount(); ++i) {
        CHECK(a.getGrid().getCellState(i) == b.getGrid().getCellState(i));
    }
}

TEST_CASE("Board/RandomizeRestoresLayoutOnFailure") {
    GridBoard board(5, 5);
    board.setStartCell(GridCell{0, 0});
    board.setEndCell(GridCell{4, 4});
    board.toggleBlock(2, 2);

    // every other cell blocked, start and end can never connect
    CHECK_FALSE(board.randomizeBlocksEnsuringPath(1.0f, 3, 5u));
    CHECK(board.getGrid().countBlocked() == 1);
    CHECK(board.getGrid().isBlocked(2, 2));
}

TEST_CASE("Board/RandomizeNeedsBothEndpoints") {
    GridBoard board(5, 5);
    board.setStartCell(GridCell{0, 0});
    CHECK_FALSE(board.randomizeBlocksEnsuringPath(0.2f, 10, 1u));
    CHECK(board.getGrid().countBlocked() == 0);
}

TEST_CASE("Board/ResizeClearsSelection") {
    GridBoard board(4, 4);
    board.selectCell(0, 0);
    board.selectCell(1, 1);

    board.resize(6, 3);
    CHECK(board.getWidth() == 6);
    CHECK(board.getHeight() == 3);
    CHECK_FALSE(board.getStartCell());
    CHECK_FALSE(board.getEndCell());
    CHECK(board.getClickStage() == GridBoard::ClickStage::PickStart);
}
