#pragma once

#include <memory> // shared_ptr
#include <string> // string
#include <utility> // move
#include <vector> // vector

struct Book {
    std::string book_id;
    std::string title;
    std::string author;
    std::string category;
    std::string isbn; // empty when unknown

    bool operator==(const Book& other) const { return book_id == other.book_id; }
};

typedef std::shared_ptr<const Book> BookPtr;
typedef std::vector<BookPtr> BookStack;

inline BookPtr makeBook(std::string book_id, std::string title, std::string author,
                        std::string category, std::string isbn = {}) {
    return std::make_shared<const Book>(Book{
        std::move(book_id), std::move(title), std::move(author),
        std::move(category), std::move(isbn)
    });
}
