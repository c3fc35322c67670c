#pragma once

#include "../Rpc/RecordsClient.hpp"

// Keeps a record of each dictation attempt. Best effort: implementations
// report failures through the return value and never throw.
class IInteractionStore {
public:
    virtual ~IInteractionStore() = default;

    virtual bool CreateInteraction(const InteractionRecord& record) = 0;
};
