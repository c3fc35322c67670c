#pragma once

#include <string>

#include "../Protocol/ProtocolTypes.hpp"

// Environmental context for a session. Best effort: fields that cannot be
// gathered come back empty.
class IContextProvider {
public:
    virtual ~IContextProvider() = default;

    virtual ConfigSnapshot GatherContext(Mode mode) = 0;

    // A few characters before the text cursor, for the grammar rules.
    virtual std::string GetCursorContext(size_t length) = 0;
};
