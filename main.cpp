#include "app/RedlineApp.hpp"

#include <string>

int main(int argc, char** argv) {
    redline::app::RedlineApp app(argc > 1 ? std::string(argv[1]) : std::string());
    return app.Run();
}
