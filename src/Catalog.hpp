#pragma once

#include "Book.hpp"
#include "Room.hpp"

#include <cstddef> // size_t
#include <map> // map
#include <stdexcept> // runtime_error
#include <string> // string
#include <vector> // vector

// Thrown when one category ends up on more than one shelf
class PlacementError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

// One shelved book, flattened for reports
struct CatalogRow {
    std::string book_id;
    std::string title;
    std::string author;
    std::string category;
    std::string isbn;
    std::string shelf_name;
};

typedef std::vector<CatalogRow> CatalogRows;
typedef std::map<std::string, std::map<std::string, std::size_t>> CategoryCounts;

// Operations over a borrowed room. The room must outlive the catalog.
class Catalog {
    public:
        explicit Catalog(Room* room);

        // Puts each book on the first shelf named after its category.
        // Books without such a shelf are left out and handed back.
        BookStack organizeBooksByCategory(const BookStack& pile);

        void sortBooksOnAllShelves();

        std::string dump() const;

        void verifyCategoryPlacement() const;

        CatalogRows rows() const;
        CategoryCounts categoryCounts() const;

        Room& room() { return *rm; }
        const Room& room() const { return *rm; }

    private:
        Room* rm;
};
