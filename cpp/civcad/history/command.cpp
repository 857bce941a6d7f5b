#include "civcad/history/command.h"
#include "civcad/core/errors.h"
#include "civcad/core/util.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace civcad {

namespace {

std::optional<std::size_t> indexOf(const EntityList& entities, EntityId id) {
    for (std::size_t i = 0; i < entities.size(); ++i) {
        if (entities[i].id == id) return i;
    }
    return std::nullopt;
}

// Shared three-pass application. `useAfter` selects the redo direction.
EntityList applyChanges(const EntityList& entities, const std::vector<EntityChange>& changes, bool useAfter) {
    const auto target = [useAfter](const EntityChange& c) -> const std::optional<Entity>& {
        return useAfter ? c.after : c.before;
    };
    const auto source = [useAfter](const EntityChange& c) -> const std::optional<Entity>& {
        return useAfter ? c.before : c.after;
    };

    std::unordered_set<EntityId> removed;
    for (const EntityChange& c : changes) {
        if (source(c) && !target(c)) removed.insert(c.id);
    }

    EntityList out;
    out.reserve(entities.size() + changes.size());
    for (const Entity& e : entities) {
        if (removed.count(e.id) == 0) out.push_back(e);
    }

    for (const EntityChange& c : changes) {
        if (!source(c) || !target(c)) continue;
        if (auto idx = indexOf(out, c.id)) out[*idx] = *target(c);
    }

    std::vector<const EntityChange*> inserts;
    for (const EntityChange& c : changes) {
        if (!source(c) && target(c)) inserts.push_back(&c);
    }
    std::stable_sort(inserts.begin(), inserts.end(),
                     [](const EntityChange* a, const EntityChange* b) { return a->index < b->index; });
    for (const EntityChange* c : inserts) {
        const std::size_t at = std::min(c->index, out.size());
        out.insert(out.begin() + static_cast<std::ptrdiff_t>(at), *target(*c));
    }
    return out;
}

Command makeCommand(CommandType type, std::string payload) {
    Command cmd;
    cmd.type = type;
    cmd.timestampMs = nowMilliseconds();
    cmd.payload = std::move(payload);
    return cmd;
}

} // namespace

const char* commandTypeName(CommandType type) {
    switch (type) {
        case CommandType::AddEntity: return "add-entity";
        case CommandType::DeleteEntity: return "delete-entity";
        case CommandType::ModifyEntity: return "modify-entity";
        case CommandType::ReplaceEntities: return "replace-entities";
    }
    return "unknown";
}

EntityList Command::redo(const EntityList& entities) const {
    return applyChanges(entities, changes, true);
}

EntityList Command::undo(const EntityList& entities) const {
    return applyChanges(entities, changes, false);
}

Command makeAddEntityCommand(const EntityList& entities, Entity entity, std::string payload) {
    Command cmd = makeCommand(CommandType::AddEntity, std::move(payload));
    EntityChange change;
    change.id = entity.id;
    change.index = entities.size();
    change.after = std::move(entity);
    cmd.changes.push_back(std::move(change));
    return cmd;
}

Command makeDeleteEntityCommand(const EntityList& entities, EntityId id, std::string payload) {
    const auto idx = indexOf(entities, id);
    if (!idx) {
        throw KernelException(KernelError::EntityNotFound, "delete: entity " + std::to_string(id) + " not found");
    }
    Command cmd = makeCommand(CommandType::DeleteEntity, std::move(payload));
    EntityChange change;
    change.id = id;
    change.index = *idx;
    change.before = entities[*idx];
    cmd.changes.push_back(std::move(change));
    return cmd;
}

Command makeModifyEntityCommand(const EntityList& entities, EntityId id, Entity updated, std::string payload) {
    const auto idx = indexOf(entities, id);
    if (!idx) {
        throw KernelException(KernelError::EntityNotFound, "modify: entity " + std::to_string(id) + " not found");
    }
    updated.id = id;
    Command cmd = makeCommand(CommandType::ModifyEntity, std::move(payload));
    EntityChange change;
    change.id = id;
    change.index = *idx;
    change.before = entities[*idx];
    change.after = std::move(updated);
    cmd.changes.push_back(std::move(change));
    return cmd;
}

Command makeReplaceEntitiesCommand(const EntityList& before, const EntityList& after, std::string payload) {
    Command cmd = makeCommand(CommandType::ReplaceEntities, std::move(payload));

    std::unordered_map<EntityId, std::size_t> beforeIndex;
    std::unordered_map<EntityId, std::size_t> afterIndex;
    for (std::size_t i = 0; i < before.size(); ++i) beforeIndex[before[i].id] = i;
    for (std::size_t i = 0; i < after.size(); ++i) afterIndex[after[i].id] = i;

    // Kept entities must appear in the same relative order for in-place replacement.
    std::vector<EntityId> keptBefore;
    std::vector<EntityId> keptAfter;
    for (const Entity& e : before) {
        if (afterIndex.count(e.id)) keptBefore.push_back(e.id);
    }
    for (const Entity& e : after) {
        if (beforeIndex.count(e.id)) keptAfter.push_back(e.id);
    }
    const bool reordered = keptBefore != keptAfter;

    for (std::size_t i = 0; i < before.size(); ++i) {
        const Entity& e = before[i];
        if (!reordered && afterIndex.count(e.id)) continue;
        EntityChange change;
        change.id = e.id;
        change.index = i;
        change.before = e;
        cmd.changes.push_back(std::move(change));
    }

    for (std::size_t i = 0; i < after.size(); ++i) {
        const Entity& e = after[i];
        auto it = beforeIndex.find(e.id);
        EntityChange change;
        change.id = e.id;
        change.index = i;
        change.after = e;
        if (!reordered && it != beforeIndex.end()) {
            const Entity& old = before[it->second];
            if (old == e) continue;
            change.before = old;
        }
        cmd.changes.push_back(std::move(change));
    }
    return cmd;
}

} // namespace civcad
