#include "roomsync/network.hpp"

namespace roomsync {

namespace {

std::mutex& factory_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<network_factory>& factory_slot() {
    static std::shared_ptr<network_factory> factory;
    return factory;
}

} // namespace

void set_network_factory(std::shared_ptr<network_factory> factory) {
    std::lock_guard<std::mutex> lock(factory_mutex());
    factory_slot() = std::move(factory);
}

std::shared_ptr<network_factory> get_network_factory() {
    std::lock_guard<std::mutex> lock(factory_mutex());
    auto& factory = factory_slot();
    if (!factory) {
        factory = std::make_shared<mock_network_factory>();
    }
    return factory;
}

} // namespace roomsync
