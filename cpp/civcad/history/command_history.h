#pragma once

#include "civcad/core/kernel_constants.h"
#include "civcad/history/command.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace civcad {

// Bounded undo/redo stacks over caller-owned entity lists. Nothing here throws
// on an empty stack; undo and redo report whether a command was applied.
class CommandHistory {
public:
    explicit CommandHistory(std::size_t capacity = kernel_constants::HISTORY_CAPACITY);

    // Assigns the command id, applies redo to `entities`, pushes the command and
    // clears the redo stack. The oldest command is evicted past capacity.
    const Command& execute(Command command, EntityList& entities);

    bool undo(EntityList& entities);
    bool redo(EntityList& entities);

    bool canUndo() const noexcept { return !undoStack_.empty(); }
    bool canRedo() const noexcept { return !redoStack_.empty(); }
    std::size_t undoSize() const noexcept { return undoStack_.size(); }
    std::size_t redoSize() const noexcept { return redoStack_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }

    // nullptr when the stack is empty.
    const Command* peekUndo() const noexcept;
    const Command* peekRedo() const noexcept;

    void clear();

private:
    std::size_t capacity_;
    std::uint32_t nextCommandId_ = 1;
    std::deque<Command> undoStack_;
    std::vector<Command> redoStack_;
};

} // namespace civcad
