#pragma once
#include <memory>
#include <string>

class HandlerContext;

class IHandler {
public:
    virtual ~IHandler() = default;
    virtual std::string name() const = 0;
    // Content type the handler announces itself; empty leaves it to the server.
    virtual std::string content_type() const { return std::string(); }
    virtual int execute(HandlerContext& context) = 0;
};
