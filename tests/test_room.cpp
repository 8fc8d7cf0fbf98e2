#include "Room.hpp"
#include "Shelf.hpp"

#include <catch2/catch.hpp>

TEST_CASE("addShelf appends without checking names", "[room]") {
    Room room{"Bob"};
    room.addShelf(Shelf{"Fiction"});
    room.addShelf(Shelf{"History"});
    room.addShelf(Shelf{"Fiction"});

    CHECK(room.owner() == "Bob");
    REQUIRE(room.shelves().size() == 3);
    CHECK(room.shelves()[0].name() == "Fiction");
    CHECK(room.shelves()[1].name() == "History");
    CHECK(room.shelves()[2].name() == "Fiction");
}

TEST_CASE("a shelf added to a room is the room's own copy", "[room]") {
    Shelf shelf{"Fiction"};
    Room room{"Bob"};
    room.addShelf(shelf);

    room.shelves()[0].addBooks({makeBook("1", "a", "x", "Fiction")});

    CHECK(shelf.empty());
    CHECK(room.shelves()[0].size() == 1);
}
