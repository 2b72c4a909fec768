#pragma once
#include <memory>
#include "resinslice/SliceService.hpp"

namespace resinslice {

    class Server {
    public:
        explicit Server(std::shared_ptr<SliceService> service);

        // Blocks serving GET /health, POST /slice and POST /islands.
        void start(int port);

    private:
        std::shared_ptr<SliceService> service;
    };

} // namespace resinslice
