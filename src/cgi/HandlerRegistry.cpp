#include "HandlerRegistry.hpp"

void HandlerRegistry::add(std::unique_ptr<IHandler> handler) {
    auto key = handler->name();
    handlers_[std::move(key)] = std::move(handler);
}

IHandler* HandlerRegistry::find(const std::string& name) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) return nullptr;
    return it->second.get();
}

std::vector<std::string> HandlerRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (auto& kv : handlers_) names.push_back(kv.first);
    return names;
}
