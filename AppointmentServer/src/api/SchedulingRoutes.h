#pragma once

#include <memory>
#include "net/Router.h"
#include "scheduling/Calendar.h"
#include "scheduling/Types.h"
#include "store/SlotStore.h"

namespace api {

// Binds the scheduling operations to HTTP routes. Store work runs on the runner; the
// reply callback is invoked from the runner's thread.
class SchedulingRoutes {
public:
    SchedulingRoutes(std::shared_ptr<store::StoreRunner> runner, scheduling::Clock clock, scheduling::Limits limits)
        : runner_(std::move(runner)), clock_(std::move(clock)), limits_(limits) {}

    void register_routes(Router& router);

private:
    std::shared_ptr<store::StoreRunner> runner_;
    scheduling::Clock clock_;
    scheduling::Limits limits_;
};

}
