#include "App.hpp"
#include "Book.hpp"
#include "Catalog.hpp"
#include "Librarydb.hpp"
#include "Room.hpp"

#include "SQLiteCpp/Exception.h"

#include "ftxui/component/screen_interactive.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/component/component_options.hpp"
#include "ftxui/dom/elements.hpp"

#include <algorithm> // clamp
#include <cstdlib> // EXIT_FAILURE, EXIT_SUCCESS
#include <exception> // exception
#include <iostream> // cout, cerr
#include <string> // string, to_string
#include <vector> // vector

class Exit : public std::exception {};

ftxui::MenuOption menuOption() {
    using namespace ftxui;
    auto option = MenuOption();

    option.entries_option.transform = [](const EntryState& state) {
        Element e;
        if (state.focused) {
            e = text("> " + state.label);
        }
        if (state.active) {
            e = text("< " + state.label + " >") | bold;
        }
        if (!state.focused && !state.active) {
            e = text("  " + state.label) | dim;
        }
        return e;
    };

    return option;
}

ftxui::ButtonOption buttonOption() {
    return ftxui::ButtonOption::Ascii();
}

int App::run() {
    try {
        home();
    }
    catch(const Exit& e){
        screen.Exit();
    }
    catch (const SQLite::Exception& e) {
        screen.Exit();
        std::cerr<<"[ERROR] Database engine error. <"<<e.what()<<">"<<std::endl;
        return EXIT_FAILURE;
    }
    catch(const std::exception& e) {
        screen.Exit();
        std::cerr<<"[ERROR] Unknown error. <"<<e.what()<<">"<<std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int App::print() {
    try {
        Room room = db.loadRoom(owner);
        Catalog catalog{&room};
        std::cout<<catalog.dump();

        auto pile = db.getPile();
        if(not pile.empty())
            std::cerr<<"[WARN] "<<pile.size()<<" book(s) without a matching shelf"<<std::endl;
    }
    catch (const SQLite::Exception& e) {
        std::cerr<<"[ERROR] Database engine error. <"<<e.what()<<">"<<std::endl;
        return EXIT_FAILURE;
    }
    catch(const std::exception& e) {
        std::cerr<<"[ERROR] Unknown error. <"<<e.what()<<">"<<std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

void App::home() {
    using namespace ftxui;

    Room room = db.loadRoom(owner);
    Catalog catalog{&room};
    BookStack pile = db.getPile();

    std::string status;
    bool status_is_error = false;
    auto report = [&](std::string message, bool error = false) {
        status = std::move(message);
        status_is_error = error;
    };

    // Shelf menu on the left, refreshed after every action
    std::vector<std::string> shelf_entries;
    auto refresh_shelves = [&] {
        shelf_entries.clear();
        for(const auto& shelf : room.shelves()) {
            shelf_entries.push_back(shelf.summary());
        }
    };
    refresh_shelves();

    int shelf_selected = 0;
    auto shelf_menu = Menu(&shelf_entries, &shelf_selected, menuOption());

    // Books of the selected shelf
    std::vector<std::string> book_entries;
    int book_selected = 0;
    auto refresh_books = [&] {
        book_entries.clear();
        if(room.shelves().empty())
            return;
        for(const auto& book : room.shelves()[shelf_selected].books()) {
            book_entries.push_back(book->author + "_" + book->title);
        }
        if(not book_entries.empty())
            book_selected = std::clamp(book_selected, 0, static_cast<int>(book_entries.size()) - 1);
    };
    auto book_menu = Menu(&book_entries, &book_selected, menuOption()) | size(ftxui::WIDTH, ftxui::EQUAL, entryMenuSize);

    auto organize_action = [&] {
        if(pile.empty()) {
            report("Nothing left in the pile");
            return;
        }
        auto before = pile.size();
        pile = catalog.organizeBooksByCategory(pile);
        refresh_shelves();
        report("Placed " + std::to_string(before - pile.size()) + " book(s), " +
               std::to_string(pile.size()) + " without a matching shelf", not pile.empty());
    };

    auto sort_action = [&] {
        catalog.sortBooksOnAllShelves();
        report("Shelves sorted by title");
    };

    auto verify_action = [&] {
        try {
            catalog.verifyCategoryPlacement();
            report("Every category sits on one shelf");
        }
        catch(const PlacementError& e) {
            report(e.what(), true);
        }
    };

    auto save_action = [&] {
        db.saveRoom(room);
        report("Saved " + std::to_string(catalog.rows().size()) + " placement(s)");
    };

    auto actions = Container::Vertical({
        Button("Organize pile", organize_action, buttonOption()),
        Button("Sort shelves", sort_action, buttonOption()),
        Button("Verify", verify_action, buttonOption()),
        Button("Save", save_action, buttonOption()),
        Button("Quit", [] { throw Exit(); }, buttonOption())
    });

    auto main_menu_container = Container::Vertical({
        Renderer([this]{
            return hbox({
                filler(),
                text(owner + "'s room") | color(Color::Green),
                filler()
            });
        }),
        shelf_menu,
        Renderer([] { return filler(); }),
        Renderer([&pile] { return text("Pile: " + std::to_string(pile.size()) + " book(s)") | dim; }),
        Renderer([] { return separator(); }),
        actions
    });

    auto shelf_view = Container::Horizontal({
        book_menu,
        Renderer([] { return separator(); }),
        bookDetail(room, shelf_selected, book_selected)
    }) | Maybe([&] { return not book_entries.empty(); });

    auto layout = Container::Horizontal({
        main_menu_container,
        Renderer([] { return separator(); }),
        Container::Vertical({
            shelf_view,
            Renderer([] { return text("Empty shelf") | dim; }) | Maybe([&] { return book_entries.empty(); })
        })
    });

    auto home_screen = Renderer(layout, [&] {
        refresh_books();
        return vbox({
            layout->Render() | flex,
            separator(),
            text(status) | color(status_is_error ? Color::Red : Color::Green)
        }) | border;
    });

    screen.Loop(home_screen);
}

ftxui::Component App::bookDetail(const Room& room, const int& shelf_selector, const int& book_selector) {
    using namespace ftxui;

    auto book = [&]() -> const BookPtr& {
        return room.shelves()[shelf_selector].books()[book_selector];
    };

    return Container::Vertical({
        Container::Horizontal({ label("Title"), Renderer([book] { return text(book()->title); }) }),
        Container::Horizontal({ label("Author"), Renderer([book] { return text(book()->author); }) }),
        Container::Horizontal({ label("Category"), Renderer([book] { return text(book()->category); }) }),
        Container::Horizontal({ label("ISBN"), Renderer([book] { return text(book()->isbn); }) })
            | Maybe([book] { return not book()->isbn.empty(); }),
        Container::Horizontal({ label("Id"), Renderer([book] { return text(book()->book_id) | dim; }) })
    });
}

ftxui::Component App::label(const std::string txt) {
    using namespace ftxui;
    return Container::Horizontal({
            Renderer([]{ return filler(); }),
            Renderer([txt]{ return text(txt + ": "); })
        }) | size(ftxui::WIDTH, ftxui::EQUAL, 12);
}
