#pragma once

#include "core/shared/types.h"

#include <cstdint>

namespace mc {

// Observer of the MemoryStore write path.
//
// onInsert/onUpdate/onDelete run synchronously inside the write's
// transaction, after the row statement executed. Returning false rolls the
// whole write back. onCommitted runs after a successful commit and cannot
// fail the write.
class MemoryWriteHook {
public:
    virtual ~MemoryWriteHook() = default;

    virtual bool onInsert(const MemoryRecord& inserted) = 0;
    virtual bool onUpdate(const MemoryRecord& before, const MemoryRecord& after) = 0;
    virtual bool onDelete(const MemoryRecord& removed) = 0;

    virtual void onCommitted(WriteKind kind, const MemoryRecord& record)
    {
        Q_UNUSED(kind);
        Q_UNUSED(record);
    }
};

} // namespace mc
