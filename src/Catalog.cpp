#include "Catalog.hpp"

#include <algorithm> // find_if
#include <map> // map
#include <sstream> // ostringstream
#include <stdexcept> // invalid_argument

Catalog::Catalog(Room* room) : rm(room) {
    if(rm == nullptr) {
        throw std::invalid_argument{"catalog constructed without a room"};
    }
}

BookStack Catalog::organizeBooksByCategory(const BookStack& pile) {
    auto& shelves = rm->shelves();

    // shelf index -> books bound for it, in pile order
    std::map<std::size_t, BookStack> batches;
    BookStack unplaced;

    for(const auto& book : pile) {
        auto it = std::ranges::find_if(shelves, [&book](const Shelf& shelf) {
            return shelf.name() == book->category;
        });
        if(it == shelves.end()) {
            unplaced.push_back(book);
            continue;
        }
        batches[static_cast<std::size_t>(it - shelves.begin())].push_back(book);
    }

    for(const auto& [index, books] : batches) {
        shelves[index].addBooks(books);
    }

    return unplaced;
}

void Catalog::sortBooksOnAllShelves() {
    for(auto& shelf : rm->shelves()) {
        shelf.sortBooksByTitle();
    }
}

std::string Catalog::dump() const {
    std::ostringstream oss;
    oss<<"Room: "<<rm->owner()<<"\n";
    for(const auto& shelf : rm->shelves()) {
        oss<<"  Shelf: "<<shelf.name()<<"\n";
        for(const auto& book : shelf.books()) {
            oss<<"    - "<<book->title<<" by "<<book->author<<" ["<<book->category<<"]";
            if(not book->isbn.empty())
                oss<<" ISBN "<<book->isbn;
            oss<<"\n";
        }
    }
    return oss.str();
}

void Catalog::verifyCategoryPlacement() const {
    std::map<std::string, std::string> seen; // category -> shelf name
    for(const auto& shelf : rm->shelves()) {
        for(const auto& cat : shelf.categories()) {
            auto [it, inserted] = seen.emplace(cat, shelf.name());
            if(not inserted && it->second != shelf.name()) {
                throw PlacementError{
                    "Category '" + cat + "' was found on shelves '" + it->second + "' and '" + shelf.name() + "'"
                };
            }
        }
    }
}

CatalogRows Catalog::rows() const {
    CatalogRows result;
    for(const auto& shelf : rm->shelves()) {
        for(const auto& book : shelf.books()) {
            result.push_back({book->book_id, book->title, book->author, book->category, book->isbn, shelf.name()});
        }
    }
    return result;
}

CategoryCounts Catalog::categoryCounts() const {
    CategoryCounts counts;
    for(const auto& row : rows()) {
        ++counts[row.shelf_name][row.category];
    }
    return counts;
}
