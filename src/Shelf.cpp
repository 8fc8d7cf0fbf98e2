#include "Shelf.hpp"

#include <algorithm> // stable_sort
#include <sstream> // ostringstream

void Shelf::addBooks(const BookStack& books) {
    stack.insert(stack.end(), books.begin(), books.end());
}

void Shelf::sortBooksByTitle() {
    // plain byte order, equal titles keep their place
    std::ranges::stable_sort(stack, [](const BookPtr& a, const BookPtr& b) {
        return a->title < b->title;
    });
}

std::set<std::string> Shelf::categories() const {
    std::set<std::string> cats;
    for(const auto& book : stack) {
        cats.insert(book->category);
    }
    return cats;
}

std::string Shelf::summary() const {
    std::ostringstream oss;
    oss<<shelf_name<<" ("<<stack.size()<<" books; categories: ";

    auto cats = categories();
    if(cats.empty()) {
        oss<<"-";
    }
    for(auto it = cats.begin(); it != cats.end(); ++it) {
        if(it != cats.begin())
            oss<<", ";
        oss<<*it;
    }
    oss<<")";
    return oss.str();
}
