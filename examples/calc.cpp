#include <addsub/driver.hpp>

#include <iostream>

int main(int argc, char** argv) {
    return addsub::run_cli(argc, argv, std::cin, std::cout, std::cerr);
}
