#pragma once

#include "Book.hpp"
#include "Room.hpp"

#include "SQLiteCpp/Database.h"
#include "SQLiteCpp/Statement.h"

#include <memory> // unique_ptr
#include <string> //string

// SQLite backed store of shelves, books and their placements
class Librarydb{
    public:
        explicit Librarydb(const std::string& dbfile) : db_path(dbfile) { init(); }

        // SQLite special name for a database that lives only in memory
        static bool isInMemory(const std::string& dbfile) { return dbfile == ":memory:"; }

        Room loadRoom(const std::string& owner);
        void saveRoom(const Room& room);

        BookStack getPile(); // books not placed on any shelf
        BookStack getAllBooks();
        BookPtr getBook(const std::string& book_id);

        void addShelf(const std::string& name);
        void addBook(const BookPtr& book);
        void removeBook(const std::string& book_id);

    private:
        void init();
        std::string db_path;
        std::unique_ptr<SQLite::Database> databs;
        void makeSchema();
        void seed();
        BookPtr extractBookInfo(const SQLite::Statement& stmnt);
};
