#include "CorpusRequestHandler.hpp"
#include "groundwork/JsonCodec.hpp"

#include <fstream>
#include <iostream>

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <corpus.json> <request.json> [config.json]\n";
        return 2;
    }
    try {
        auto config = argc > 3 ? groundwork::EngineConfig::fromFile(argv[3]) : groundwork::EngineConfig{};
        config.applyEnvironment();
        config.validate();

        std::ifstream in(argv[2]);
        if (!in) throw std::runtime_error(std::string("cannot open request file ") + argv[2]);
        auto request = nlohmann::json::parse(in);

        CorpusRequestHandler handler(groundwork::loadChunks(argv[1]), std::move(config));
        auto response = handler.handle(request);
        std::cout << response.dump(2) << std::endl;
        return response.value("status", "") == "ok" ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
