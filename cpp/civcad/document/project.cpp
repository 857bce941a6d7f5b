#include "civcad/document/project.h"
#include "civcad/core/util.h"

#include <utility>

namespace civcad {

ProjectDocument createProject(IdSource& ids, std::string name) {
    ProjectDocument project;
    project.id = ids.next();
    project.name = std::move(name);
    project.layers = defaultLayers();

    Viewport main = createViewport(ids, "Main");
    main.active = true;
    project.viewports.push_back(std::move(main));

    project.createdAtMs = nowMilliseconds();
    project.modifiedAtMs = project.createdAtMs;
    return project;
}

Viewport createViewport(IdSource& ids, std::string name) {
    Viewport v;
    v.id = ids.next();
    v.name = std::move(name);
    return v;
}

const Viewport* activeViewport(const ProjectDocument& project) {
    for (const Viewport& v : project.viewports) {
        if (v.active) return &v;
    }
    return nullptr;
}

Point2 screenToWorld(const Point2& screen, const Viewport& viewport, double canvasWidth, double canvasHeight) {
    return {
        (screen.x - canvasWidth / 2.0 - viewport.pan.x) / viewport.zoom,
        (screen.y - canvasHeight / 2.0 - viewport.pan.y) / viewport.zoom,
    };
}

Point2 worldToScreen(const Point2& world, const Viewport& viewport, double canvasWidth, double canvasHeight) {
    return {
        world.x * viewport.zoom + viewport.pan.x + canvasWidth / 2.0,
        world.y * viewport.zoom + viewport.pan.y + canvasHeight / 2.0,
    };
}

} // namespace civcad
