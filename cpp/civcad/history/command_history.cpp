#include "civcad/history/command_history.h"
#include "civcad/core/logging.h"

#include <utility>

namespace civcad {

CommandHistory::CommandHistory(std::size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

const Command& CommandHistory::execute(Command command, EntityList& entities) {
    command.id = nextCommandId_++;
    entities = command.redo(entities);

    undoStack_.push_back(std::move(command));
    while (undoStack_.size() > capacity_) {
        CIVCAD_LOG_DEBUG("history: evicting command %u", undoStack_.front().id);
        undoStack_.pop_front();
    }
    redoStack_.clear();
    return undoStack_.back();
}

bool CommandHistory::undo(EntityList& entities) {
    if (undoStack_.empty()) return false;
    Command command = std::move(undoStack_.back());
    undoStack_.pop_back();
    entities = command.undo(entities);
    redoStack_.push_back(std::move(command));
    return true;
}

bool CommandHistory::redo(EntityList& entities) {
    if (redoStack_.empty()) return false;
    Command command = std::move(redoStack_.back());
    redoStack_.pop_back();
    entities = command.redo(entities);
    undoStack_.push_back(std::move(command));
    return true;
}

const Command* CommandHistory::peekUndo() const noexcept {
    return undoStack_.empty() ? nullptr : &undoStack_.back();
}

const Command* CommandHistory::peekRedo() const noexcept {
    return redoStack_.empty() ? nullptr : &redoStack_.back();
}

void CommandHistory::clear() {
    undoStack_.clear();
    redoStack_.clear();
}

} // namespace civcad
