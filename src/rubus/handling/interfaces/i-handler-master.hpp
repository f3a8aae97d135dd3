#pragma once

// standard
#include <memory>


namespace rubus {

    class RequestHandler;

    // Owner deciding what happens to connection after each handler run.
    class IHandlerMaster {
    public:
        virtual void onHandlerDone(std::shared_ptr<RequestHandler> handler) = 0;
        virtual ~IHandlerMaster() = default;
    };

}
