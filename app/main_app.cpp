#include "run_app.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <config_file.ini>" << std::endl;
        return 1;
    }
    return cradial::app::run(argv[1]);
}
