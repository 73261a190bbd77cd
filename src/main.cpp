// ========================= src/main.cpp =========================
#include "ui/Driver.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    tumble::Driver driver(std::cin, std::cout, std::cerr);
    return driver.run(std::vector<std::string>(argv, argv + argc));
}
