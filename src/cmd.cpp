#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "mapnik/debug.hpp"
#include "ovl/cmd.hpp"

using namespace std;

void printHelp() {
    cout << "Command not recognized." << endl;
    cout << "Commands: render | split | join" << endl;
}

int main(int argc, char **argv)
{
    auto logger = spdlog::stderr_color_mt("overlay");
    logger->set_pattern("%^[%l]%$ %v");
    spdlog::set_default_logger(logger);
    mapnik::logger::instance().set_severity(mapnik::logger::none);

    vector<string> args(argv, argv+argc);
    if (args.size() < 2) {
        printHelp();
        return 1;
    }
    try {
        if (args[1] == "render") {
            return cmdRender(argc,argv);
        } else if (args[1] == "split") {
            return cmdSplit(argc,argv);
        } else if (args[1] == "join") {
            return cmdJoin(argc,argv);
        }
    } catch (const exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    printHelp();
    return 1;
}
