#include "App.hpp"
#include "Librarydb.hpp"

#include "SQLiteCpp/Exception.h"

#include <iostream> // cerr
#include <cstdlib> // EXIT_FAILURE, getenv
#include <exception> // exception
#include <filesystem> // create_directories, canonical, is_regular_file
#include <iterator> // next
#include <memory> // make_unique
#include <stdexcept> // invalid_argument
#include <vector> // vector
#include <string> // string

void print_usage() {
std::cerr<<
R"#(
Home Library

Usage: home-library [-p] [-o owner] [-d dbfile]
    -p          Print the room and exit
    -o OWNER    Name of the room's owner
    -d FILE     Open database file FILE (":memory:" for a scratch database)
)#";
}

int main(int argc, char** argv) {
    std::vector<std::string> args{argv+1, argv+argc};
    bool print_only = false;
    std::string db_path;
    std::string owner;

    for(auto it = args.begin(); it != args.end(); ++it) {
        if(*it == "-p")
            print_only = true;
        else if (*it == "-d" || *it == "-o") {
            if(std::next(it) == args.end()){
                print_usage();
                return EXIT_FAILURE;
            }
            (*it == "-d" ? db_path : owner) = *std::next(it);
            ++it;
        }
        else {
            print_usage();
            return EXIT_FAILURE;
        }
    }

    if(owner.empty()) {
        auto user = std::getenv("USER");
        owner = user ? user : "Owner";
    }

    if(Librarydb::isInMemory(db_path)) {
        // nothing on disk to check
    }
    else if(not db_path.empty()) {
        try{
            auto path = std::filesystem::canonical(db_path);
            if (not std::filesystem::is_regular_file(path)){
                std::cerr<<"Error: Can't open database file "<<path<<" : Not regular file\n";
                return EXIT_FAILURE;
            }
        }
        catch(const std::exception& e){
            std::cerr<<"Error: Database file "<<db_path<<" doesn't exist!\n";
            return EXIT_FAILURE;
        }
    }
    else {
        std::filesystem::path data_dir;
        if(auto dir = std::getenv("XDG_DATA_HOME")){
            data_dir = dir;
        }
        else if(auto home = std::getenv("HOME")) {
            data_dir = std::filesystem::path{home} / ".local" / "share";
        }
        else {
            std::cerr<<"[ERROR] Neither XDG_DATA_HOME nor HOME is set, use -d"<<std::endl;
            return EXIT_FAILURE;
        }
        data_dir /= "home-library";
        std::filesystem::create_directories(data_dir);
        db_path = data_dir / "library.db";
    }

    std::unique_ptr<Librarydb> db;
    try {
        db = std::make_unique<Librarydb>(db_path);
    }
    catch(const std::invalid_argument& e) {
        std::cerr<<"[ERROR] Failed to initialize database: <"<<e.what()<<">"<<std::endl;
        return EXIT_FAILURE;
    }
    catch(const SQLite::Exception& e) {
        std::cerr<<"[ERROR] Failed to open database: <"<<e.what()<<">"<<std::endl;
        return EXIT_FAILURE;
    }

    App app{*db, owner};
    return print_only ? app.print() : app.run();
}
