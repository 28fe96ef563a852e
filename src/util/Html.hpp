#pragma once
#include <string>

namespace Html {
    // Replace & < > " ' with entities so text is safe inside element content
    // and quoted attribute values.
    std::string escape(const std::string& text);
}
