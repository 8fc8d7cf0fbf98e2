#include "Librarydb.hpp"
#include "Book.hpp"
#include "Room.hpp"

#include "SQLiteCpp/Exception.h"
#include "SQLiteCpp/Statement.h"
#include "SQLiteCpp/Transaction.h"

#include <cstddef> // size_t
#include <cstdint> // int64_t
#include <map> // map
#include <memory> // make_unique
#include <stdexcept> // invalid_argument
#include <string> // string

void Librarydb::init() {
    if(db_path.empty()) {
        throw std::invalid_argument{"empty database filename"};
    }
    databs = std::make_unique<SQLite::Database>(db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
    databs->exec("PRAGMA foreign_keys = ON");
    if(not databs->tableExists("shelves"))
        makeSchema();
}

void Librarydb::makeSchema(){
    SQLite::Transaction trxn(*databs);
    try
    {
        databs->exec(R"#(
                 CREATE TABLE IF NOT EXISTS [shelves]
                 (
                    [position] INTEGER PRIMARY KEY NOT NULL,
                    [name] VARCHAR(50) NOT NULL
                 )
                 )#");
        databs->exec(R"#(
                 CREATE TABLE IF NOT EXISTS [books]
                 (
                    [book_id] VARCHAR(50) PRIMARY KEY NOT NULL,
                    [title] VARCHAR(100) NOT NULL,
                    [author] VARCHAR(50) NOT NULL,
                    [category] VARCHAR(50) NOT NULL,
                    [isbn] VARCHAR(17)
                 )
                 )#");
        // Which book sits where. A book may sit on several shelves.
        databs->exec(R"#(
                 CREATE TABLE IF NOT EXISTS [placements]
                 (
                    [shelf_position] INTEGER NOT NULL,
                    [slot] INTEGER NOT NULL,
                    [book_id] VARCHAR(50) NOT NULL,
                    CONSTRAINT [pk_placements] PRIMARY KEY (shelf_position, slot),
                    FOREIGN KEY (shelf_position) REFERENCES [shelves] (position)
                        ON DELETE CASCADE,
                    FOREIGN KEY (book_id) REFERENCES [books] (book_id)
                        ON DELETE CASCADE
                 )
                 )#");
        seed();
        trxn.commit();
    }
    catch(SQLite::Exception& e) {
        trxn.rollback();
        throw;
    }
}

void Librarydb::seed() {
    // Default collection. "Mystery" has no shelf on purpose.
    for(const auto name : {"Classic", "Dystopian", "Programming", "Sci-Fi"}) {
        addShelf(name);
    }
    addBook(makeBook("b001", "A Tale of Two Cities", "Charles Dickens", "Classic"));
    addBook(makeBook("b002", "Brave New World", "Aldous Huxley", "Dystopian"));
    addBook(makeBook("b003", "The Pragmatic Programmer", "Andrew Hunt", "Programming", "978-0201616224"));
    addBook(makeBook("b004", "Clean Code", "Robert C. Martin", "Programming", "978-0132350884"));
    addBook(makeBook("b005", "Do Androids Dream of Electric Sheep?", "Philip K. Dick", "Sci-Fi"));
    addBook(makeBook("b006", "I, Robot", "Isaac Asimov", "Sci-Fi"));
    addBook(makeBook("b007", "The Name of the Rose", "Umberto Eco", "Mystery"));
}

void Librarydb::addShelf(const std::string& name) {
    auto query = R"#(
        INSERT INTO [shelves] (position, name)
        VALUES ((SELECT IFNULL(MAX(position), -1) + 1 FROM [shelves]), ?)
    )#";
    SQLite::Statement stmnt(*databs, query);
    stmnt.bind(1, name);
    stmnt.exec();
}

void Librarydb::addBook(const BookPtr& book){
    auto query = R"#(
        INSERT INTO [books] (
                    [book_id], [title], [author], [category], [isbn]
        )
        VALUES (?1, ?2, ?3, ?4, ?5)
    )#";
    SQLite::Statement stmnt(*databs, query);
    stmnt.bind(1, book->book_id);
    stmnt.bind(2, book->title);
    stmnt.bind(3, book->author);
    stmnt.bind(4, book->category);
    book->isbn.empty() ? stmnt.bind(5) : stmnt.bind(5, book->isbn);
    stmnt.exec();
}

void Librarydb::removeBook(const std::string& book_id) {
    auto query = R"#(
        DELETE FROM [books]
            WHERE book_id = ?
    )#";
    SQLite::Statement stmnt{*databs, query};
    stmnt.bind(1, book_id);
    stmnt.exec();
}

Room Librarydb::loadRoom(const std::string& owner) {
    Room room{owner};
    std::map<std::int64_t, std::size_t> index_of; // shelf position -> index in room

    SQLite::Statement shelves{*databs, "SELECT [position], [name] FROM [shelves] ORDER BY [position]"};
    while(shelves.executeStep()) {
        index_of[shelves.getColumn(0).getInt64()] = room.shelves().size();
        room.addShelf(Shelf{shelves.getColumn(1).getString()});
    }

    auto query = R"#(
        SELECT [books].[book_id], [title], [author], [category], [isbn], [shelf_position]
            FROM [placements] JOIN [books]
                ON placements.book_id = books.book_id
            ORDER BY [shelf_position], [slot]
    )#";
    SQLite::Statement stmnt{*databs, query};
    while(stmnt.executeStep()) {
        auto& shelf = room.shelves()[index_of.at(stmnt.getColumn(5).getInt64())];
        shelf.addBooks({extractBookInfo(stmnt)});
    }

    return room;
}

void Librarydb::saveRoom(const Room& room) {
    SQLite::Transaction trxn(*databs);
    try
    {
        databs->exec("DELETE FROM [placements]");

        std::size_t index = 0;
        SQLite::Statement shelves{*databs, "SELECT [position] FROM [shelves] ORDER BY [position]"};
        while(shelves.executeStep() && index < room.shelves().size()) {
            auto position = shelves.getColumn(0).getInt64();
            const auto& books = room.shelves()[index++].books();
            for(std::size_t slot = 0; slot < books.size(); ++slot) {
                SQLite::Statement stmnt{*databs, "INSERT INTO [placements] (shelf_position, slot, book_id) VALUES (?, ?, ?)"};
                stmnt.bind(1, position);
                stmnt.bind(2, static_cast<std::int64_t>(slot));
                stmnt.bind(3, books[slot]->book_id);
                stmnt.exec();
            }
        }
        if(index != room.shelves().size()) {
            throw std::invalid_argument{"room has shelves the database does not know about"};
        }
        trxn.commit();
    }
    catch(SQLite::Exception& e) {
        trxn.rollback();
        throw;
    }
}

BookStack Librarydb::getPile() {
    auto query = R"#(
        SELECT [book_id], [title], [author], [category], [isbn]
            FROM [books]
            WHERE [book_id] NOT IN (SELECT [book_id] FROM [placements])
            ORDER BY [title]
    )#";
    SQLite::Statement stmnt{*databs, query};

    BookStack books;
    while (stmnt.executeStep()) {
        books.push_back(extractBookInfo(stmnt));
    }
    return books;
}

BookStack Librarydb::getAllBooks() {
    auto query = R"#(
        SELECT [book_id], [title], [author], [category], [isbn]
        FROM [books]
    )#";
    SQLite::Statement stmnt(*databs, query);

    BookStack books;
    while (stmnt.executeStep()) {
        books.push_back(extractBookInfo(stmnt));
    }
    return books;
}

BookPtr Librarydb::getBook(const std::string& book_id) {
    auto query = R"#(
        SELECT [book_id], [title], [author], [category], [isbn]
            FROM [books]
                WHERE book_id = ?
    )#";

    SQLite::Statement stmnt(*databs, query);
    stmnt.bind(1, book_id);

    if (stmnt.executeStep()) {
        return extractBookInfo(stmnt);
    }

    return {};
}

BookPtr Librarydb::extractBookInfo(const SQLite::Statement& stmnt) {
    if(not stmnt.hasRow()) {
        return {};
    }

    return makeBook(
        stmnt.getColumn(0).getString(),
        stmnt.getColumn(1).getString(),
        stmnt.getColumn(2).getString(),
        stmnt.getColumn(3).getString(),
        stmnt.getColumn(4).isNull() ? "" : stmnt.getColumn(4).getString()
    );
}
