#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "IHandler.hpp"

class HandlerRegistry {
public:
    void add(std::unique_ptr<IHandler> handler);
    IHandler* find(const std::string& name) const;
    std::vector<std::string> list() const;
private:
    std::map<std::string, std::unique_ptr<IHandler>> handlers_;
};
