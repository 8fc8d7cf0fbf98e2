#pragma once

#include "Book.hpp"

#include <cstddef> // size_t
#include <set> // set
#include <string> // string
#include <utility> // move

// Named, ordered run of books. Books are shared, not owned.
class Shelf {
    public:
        explicit Shelf(std::string name) : shelf_name(std::move(name)) {}
        Shelf(std::string name, BookStack books) : shelf_name(std::move(name)), stack(std::move(books)) {}

        const std::string& name() const { return shelf_name; }
        const BookStack& books() const { return stack; }
        std::size_t size() const { return stack.size(); }
        bool empty() const { return stack.empty(); }

        void addBooks(const BookStack& books);
        void sortBooksByTitle();
        std::set<std::string> categories() const;

        // "<name> (<n> books; categories: a, b)"
        std::string summary() const;

        // Only for collaborators that reload a room from storage
        void clear() { stack.clear(); }

    private:
        std::string shelf_name;
        BookStack stack;
};
