#include "resinslice/EnvironmentHandler.hpp"
#include "resinslice/Logger.hpp"
#include "resinslice/Server.hpp"
#include "resinslice/SliceService.hpp"
#include <exception>
#include <memory>

int main() {
    try {
        auto& env = resinslice::EnvironmentHandler::instance();
        env.init();

        auto service = std::make_shared<resinslice::SliceService>(resinslice::SliceService::fromEnvironment());

        resinslice::Server server(service);
        server.start(env.getPort());
    } catch (const std::exception& e) {
        resinslice::Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }
    return 0;
}
