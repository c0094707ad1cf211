#include "app/MeetingLensApp.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [settings.json]" << std::endl;
        return 2;
    }
    meetinglens::app::MeetingLensApp app(argc > 1 ? argv[1] : "");
    return app.Run();
}
