#include "shuttle_api.hpp"
#include <json/json.h>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

int main(int argc, char* argv[]) {
    std::optional<std::string> configFile;
    std::optional<std::string> eventFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (!arg.empty() && arg.front() != '-' && !eventFile) {
            eventFile = arg;
        } else {
            std::cerr << "Usage: " << argv[0] << " [--config <path>] [<event.json>]" << std::endl;
            return 1;
        }
    }

    Json::Value event;
    Json::CharReaderBuilder reader;
    std::string errors;
    bool parsed = false;
    if (eventFile) {
        std::ifstream file(*eventFile);
        if (!file.is_open()) {
            std::cerr << "Error: Failed to open event file: " << *eventFile << std::endl;
            return 1;
        }
        parsed = Json::parseFromStream(reader, file, &event, &errors);
    } else {
        parsed = Json::parseFromStream(reader, std::cin, &event, &errors);
    }
    if (!parsed) {
        std::cerr << "Error: Failed to parse event: " << errors << std::endl;
        return 1;
    }

    auto response = ShuttleAPI::dispatchEvent(event, configFile);
    if (!response) {
        std::cerr << "Error: " << response.error() << std::endl;
        return 1;
    }

    Json::StreamWriterBuilder writer;
    std::cout << Json::writeString(writer, response->toJson()) << std::endl;
    return 0;
}
