#pragma once

#include "civcad/entity/entity_types.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace civcad {

enum class CommandType : std::uint8_t {
    AddEntity = 0,
    DeleteEntity = 1,
    ModifyEntity = 2,
    ReplaceEntities = 3,
};

const char* commandTypeName(CommandType type);

// One entity's state on either side of an edit. `before` only: deleted.
// `after` only: added. Both: replaced in place.
struct EntityChange {
    EntityId id = kNoId;
    std::size_t index = 0; // position in the list that holds the entity
    std::optional<Entity> before;
    std::optional<Entity> after;
};

/**
 * Undoable edit stored as before/after snapshots. redo() and undo() are pure
 * functions of the given list; they never look at the list the command was
 * built from.
 *
 * Application runs in three passes so batch edits rebuild the exact list:
 * removals by id, in-place replacements by id, then insertions in ascending
 * index order. Entries whose id is missing from the list are skipped.
 */
struct Command {
    std::uint32_t id = 0; // assigned by CommandHistory::execute
    CommandType type = CommandType::ModifyEntity;
    double timestampMs = 0.0;
    std::string payload; // opaque to the kernel
    std::vector<EntityChange> changes;

    EntityList redo(const EntityList& entities) const;
    EntityList undo(const EntityList& entities) const;
};

// Appends `entity` at the end of the list.
Command makeAddEntityCommand(const EntityList& entities, Entity entity, std::string payload = {});

// @throws KernelException(EntityNotFound)
Command makeDeleteEntityCommand(const EntityList& entities, EntityId id, std::string payload = {});

// Whole-entity replacement; `updated` takes the id being modified.
// @throws KernelException(EntityNotFound)
Command makeModifyEntityCommand(const EntityList& entities, EntityId id, Entity updated,
                                std::string payload = {});

/**
 * Diff between two whole lists, used for batch edits (move selection, import).
 * When the entities present in both lists change relative order, every entity is
 * recorded as removed and re-added.
 */
Command makeReplaceEntitiesCommand(const EntityList& before, const EntityList& after,
                                   std::string payload = {});

} // namespace civcad
