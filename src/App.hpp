#pragma once

#include "Book.hpp"
#include "Librarydb.hpp"
#include "Room.hpp"

#include "ftxui/component/screen_interactive.hpp"

#include <string> // string
#include <utility> // move

// Terminal front end over one room stored in a Librarydb
class App {
    public:
        App(Librarydb& library, std::string owner_name) : db(library), owner(std::move(owner_name)) {}

        int run();   // interactive
        int print(); // dump to stdout and leave

    private:
        void home();

        ftxui::Component bookDetail(const Room& room, const int& shelf_selector, const int& book_selector);
        ftxui::Component label(const std::string txt);

        Librarydb& db;
        std::string owner;

        int entryMenuSize = 50;
        inline static ftxui::ScreenInteractive screen = ftxui::ScreenInteractive::Fullscreen();
};
