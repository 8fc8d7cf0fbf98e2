#include "Book.hpp"
#include "Catalog.hpp"
#include "Librarydb.hpp"
#include "Room.hpp"

#include "SQLiteCpp/Exception.h"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>

TEST_CASE("an empty database filename is rejected", "[librarydb]") {
    CHECK_THROWS_AS(Librarydb{""}, std::invalid_argument);
}

TEST_CASE("a new database is seeded with shelves and a loose pile", "[librarydb]") {
    Librarydb db{":memory:"};

    Room room = db.loadRoom("Bob");
    REQUIRE(room.shelves().size() == 4);
    CHECK(room.shelves()[0].name() == "Classic");
    CHECK(room.shelves()[3].name() == "Sci-Fi");
    for(const auto& shelf : room.shelves())
        CHECK(shelf.empty());

    CHECK(db.getPile().size() == 7);
    CHECK(db.getAllBooks().size() == 7);
}

TEST_CASE("getBook finds a book by id", "[librarydb]") {
    Librarydb db{":memory:"};

    auto book = db.getBook("b004");
    REQUIRE(book);
    CHECK(book->title == "Clean Code");
    CHECK(book->isbn == "978-0132350884");

    CHECK_FALSE(db.getBook("nope"));
    CHECK(db.getBook("b001")->isbn.empty());
}

TEST_CASE("organized placements survive a save and reload", "[librarydb]") {
    Librarydb db{":memory:"};

    Room room = db.loadRoom("Bob");
    Catalog catalog{&room};
    auto dropped = catalog.organizeBooksByCategory(db.getPile());
    catalog.sortBooksOnAllShelves();
    db.saveRoom(room);

    REQUIRE(dropped.size() == 1);
    CHECK(dropped[0]->book_id == "b007");

    Room reloaded = db.loadRoom("Bob");
    Catalog reloaded_catalog{&reloaded};
    CHECK(reloaded_catalog.dump() == catalog.dump());

    auto pile = db.getPile();
    REQUIRE(pile.size() == 1);
    CHECK(pile[0]->book_id == "b007");
}

TEST_CASE("added shelves and books show up on load", "[librarydb]") {
    Librarydb db{":memory:"};
    db.addShelf("Mystery");
    db.addBook(makeBook("b100", "Gaudy Night", "Dorothy L. Sayers", "Mystery"));

    Room room = db.loadRoom("Bob");
    REQUIRE(room.shelves().size() == 5);
    CHECK(room.shelves()[4].name() == "Mystery");

    Catalog catalog{&room};
    CHECK(catalog.organizeBooksByCategory(db.getPile()).empty());
    CHECK(room.shelves()[4].size() == 2);
}

TEST_CASE("removing a book drops its placements", "[librarydb]") {
    Librarydb db{":memory:"};
    Room room = db.loadRoom("Bob");
    Catalog catalog{&room};
    catalog.organizeBooksByCategory(db.getPile());
    db.saveRoom(room);

    db.removeBook("b006");

    CHECK_FALSE(db.getBook("b006"));
    CHECK(db.loadRoom("Bob").shelves()[3].size() == 1);
}

TEST_CASE("a duplicate book id is refused by the store", "[librarydb]") {
    Librarydb db{":memory:"};
    CHECK_THROWS_AS(db.addBook(makeBook("b001", "Again", "x", "Classic")), SQLite::Exception);
}

TEST_CASE("saving a room with unknown shelves fails and keeps old placements", "[librarydb]") {
    Librarydb db{":memory:"};
    Room room = db.loadRoom("Bob");
    Catalog catalog{&room};
    catalog.organizeBooksByCategory(db.getPile());
    db.saveRoom(room);

    room.addShelf(Shelf{"Extra"});
    CHECK_THROWS_AS(db.saveRoom(room), std::invalid_argument);
    CHECK(db.getPile().size() == 1);
}

TEST_CASE("only the literal :memory: name means an in-memory database", "[librarydb]") {
    CHECK(Librarydb::isInMemory(":memory:"));
    CHECK_FALSE(Librarydb::isInMemory("library.db"));
    CHECK_FALSE(Librarydb::isInMemory(""));
    CHECK_FALSE(Librarydb::isInMemory(":MEMORY:"));
}

TEST_CASE("a database is only built from an explicit filename", "[librarydb]") {
    STATIC_REQUIRE_FALSE(std::is_convertible<std::string, Librarydb>::value);
    STATIC_REQUIRE(std::is_constructible<Librarydb, std::string>::value);
}
