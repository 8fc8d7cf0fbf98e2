#pragma once

#include "Shelf.hpp"

#include <string> // string
#include <utility> // move
#include <vector> // vector

class Room {
    public:
        explicit Room(std::string owner_name) : room_owner(std::move(owner_name)) {}

        const std::string& owner() const { return room_owner; }

        void addShelf(Shelf shelf) { shelf_list.push_back(std::move(shelf)); }

        std::vector<Shelf>& shelves() { return shelf_list; }
        const std::vector<Shelf>& shelves() const { return shelf_list; }

    private:
        std::string room_owner;
        std::vector<Shelf> shelf_list;
};
