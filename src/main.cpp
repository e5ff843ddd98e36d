#include <iostream>
#include <stdexcept>

#include "convert_app.hpp"

int main(int argc, char* argv[]) {
    try {
        vid2mp3::ConvertApp app(argc, argv);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
