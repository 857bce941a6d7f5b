#include "civcad/exchange/dxf_reader.h"
#include "civcad/core/kernel_constants.h"
#include "civcad/core/logging.h"
#include "civcad/core/string_utils.h"
#include "civcad/core/util.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/exchange/aci_palette.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <utility>

namespace civcad {

namespace {

constexpr int kAciByLayer = 256;
constexpr int kAciDefault = 7;

struct DxfPair {
    int code = 0;
    std::string value;
};

// Reads the next group code/value pair. A code line that is not an integer is
// skipped so the scanner resynchronizes on the following line.
bool readPair(const std::vector<std::string>& lines, std::size_t& index, DxfPair& pair) {
    while (index + 1 < lines.size()) {
        const auto code = parseInteger(lines[index]);
        if (!code) {
            ++index;
            continue;
        }
        pair.code = static_cast<int>(*code);
        pair.value = std::string(trimView(lines[index + 1]));
        index += 2;
        return true;
    }
    return false;
}

// Pairs up to (not including) the next code 0.
std::vector<DxfPair> readRecordBody(const std::vector<std::string>& lines, std::size_t& index) {
    std::vector<DxfPair> body;
    DxfPair pair;
    while (true) {
        const std::size_t saved = index;
        if (!readPair(lines, index, pair)) break;
        if (pair.code == 0) {
            index = saved;
            break;
        }
        body.push_back(pair);
    }
    return body;
}

struct RecordFields {
    std::string layer;
    std::optional<int> color;
    Point2 p1;
    std::optional<Point2> p2;
    std::optional<double> g40, g41, g50, g51;
    std::string text;
    std::string blockName;
    int flags = 0;
    std::vector<Point2> vertices;
};

double toDouble(const std::string& value) {
    return parseDouble(value).value_or(0.0);
}

// `vertexCodes` makes code 10 open a new vertex and code 20 finish it, as in
// LWPOLYLINE and SPLINE control points. Bulges (code 42) are read past; a bulged
// segment imports as its chord.
RecordFields parseFields(const std::vector<DxfPair>& body, bool vertexCodes) {
    RecordFields f;
    std::string chunks;
    for (const DxfPair& p : body) {
        switch (p.code) {
            case 8: f.layer = p.value; break;
            case 62: f.color = static_cast<int>(parseInteger(p.value).value_or(kAciDefault)); break;
            case 10:
                if (vertexCodes) f.vertices.push_back({toDouble(p.value), 0.0});
                else f.p1.x = toDouble(p.value);
                break;
            case 20:
                if (vertexCodes) {
                    if (!f.vertices.empty()) f.vertices.back().y = toDouble(p.value);
                } else {
                    f.p1.y = toDouble(p.value);
                }
                break;
            case 11:
                if (!f.p2) f.p2 = Point2{};
                f.p2->x = toDouble(p.value);
                break;
            case 21:
                if (!f.p2) f.p2 = Point2{};
                f.p2->y = toDouble(p.value);
                break;
            case 40: f.g40 = toDouble(p.value); break;
            case 41: f.g41 = toDouble(p.value); break;
            case 50: f.g50 = toDouble(p.value); break;
            case 51: f.g51 = toDouble(p.value); break;
            case 1: f.text = chunks + p.value; break;
            case 3: chunks += p.value; break;
            case 2: f.blockName = p.value; break;
            case 70: f.flags = static_cast<int>(parseInteger(p.value).value_or(0)); break;
            default: break;
        }
    }
    return f;
}

EntityStyle importStyle(const RecordFields& f) {
    EntityStyle style;
    int aci = f.color.value_or(kAciDefault);
    if (aci == kAciByLayer) {
        style.stroke = StrokeColor::byLayer();
        return style;
    }
    aci = std::abs(aci);
    if (aci == 0) aci = kAciDefault;
    style.stroke = StrokeColor::explicitColor(aciToColor(aci));
    return style;
}

LayerId importLayer(const RecordFields& f, const LayerList& layers) {
    if (f.layer.empty()) return kDefaultLayerId;
    if (const Layer* layer = findLayerByName(layers, f.layer)) return layer->id;
    CIVCAD_LOG_WARN("dxf: unknown layer '%s', using default layer", f.layer.c_str());
    return kDefaultLayerId;
}

class EntityImporter {
public:
    EntityImporter(IdSource& ids, const LayerList& layers, const BlockLibrary* blocks)
        : ids_(ids), layers_(layers), blocks_(blocks) {}

    void handle(const std::string& type, const std::vector<DxfPair>& body) {
        if (type == "VERTEX") {
            if (pending_) {
                const RecordFields f = parseFields(body, false);
                pending_->vertices.push_back(f.p1);
            }
            return;
        }
        flushPolyline();
        if (type == "SEQEND") return;

        if (type == "POLYLINE") {
            pending_ = parseFields(body, false);
            return;
        }
        if (type == "LWPOLYLINE" || type == "SPLINE") {
            add(type, parseFields(body, true));
            return;
        }
        add(type, parseFields(body, false));
    }

    DxfImportResult finish() {
        flushPolyline();
        CIVCAD_LOG_DEBUG("dxf: imported %zu entities, skipped %zu records",
                         result_.entities.size(), result_.skippedRecords);
        return std::move(result_);
    }

private:
    void flushPolyline() {
        if (!pending_) return;
        const RecordFields f = std::move(*pending_);
        pending_.reset();
        result_.entities.push_back(createPolyline(ids_, f.vertices, (f.flags & 1) != 0,
                                                  importLayer(f, layers_), importStyle(f)));
    }

    void skip(const std::string& type) {
        ++result_.skippedRecords;
        auto& types = result_.skippedTypes;
        if (std::find(types.begin(), types.end(), type) == types.end()) {
            CIVCAD_LOG_WARN("dxf: unsupported record type %s", type.c_str());
            types.push_back(type);
        }
    }

    void add(const std::string& type, const RecordFields& f) {
        const LayerId layer = importLayer(f, layers_);
        const EntityStyle style = importStyle(f);

        if (type == "LINE") {
            result_.entities.push_back(createLine(ids_, f.p1, f.p2.value_or(Point2{}), layer, style));
        } else if (type == "LWPOLYLINE") {
            result_.entities.push_back(createPolyline(ids_, f.vertices, (f.flags & 1) != 0, layer, style));
        } else if (type == "CIRCLE") {
            result_.entities.push_back(createCircle(ids_, f.p1, f.g40.value_or(1.0), layer, style));
        } else if (type == "ARC") {
            result_.entities.push_back(createArc(ids_, f.p1, f.g40.value_or(1.0), f.g50.value_or(0.0),
                                                 f.g51.value_or(360.0), layer, style));
        } else if (type == "TEXT" || type == "MTEXT") {
            Entity text = createText(ids_, f.p1, f.text,
                                     f.g40.value_or(kernel_constants::EXCHANGE_DEFAULT_TEXT_HEIGHT), layer, style);
            std::get<TextGeom>(text.geometry).rotation = degreesToRadians(f.g50.value_or(0.0));
            result_.entities.push_back(std::move(text));
        } else if (type == "INSERT") {
            result_.entities.push_back(createEntity(ids_, importInsert(f), layer, style));
        } else if (type == "POINT") {
            result_.entities.push_back(createPoint(ids_, f.p1, PointMarker::Cross, 1.0, layer, style));
        } else if (type == "ELLIPSE") {
            // Major axis endpoint is relative to the center.
            const Point2 major = f.p2.value_or(Point2{1.0, 0.0});
            const double rx = std::hypot(major.x, major.y);
            const double ratio = f.g40.value_or(0.5);
            result_.entities.push_back(createEllipse(ids_, f.p1, rx, rx * ratio,
                                                     radiansToDegrees(std::atan2(major.y, major.x)), layer, style));
        } else if (type == "SPLINE") {
            result_.entities.push_back(createSpline(ids_, f.vertices, (f.flags & 1) != 0, 0.5, layer, style));
        } else {
            skip(type);
        }
    }

    BlockInstanceGeom importInsert(const RecordFields& f) const {
        BlockInstanceGeom g;
        g.blockName = f.blockName.empty() ? std::string("Unknown") : f.blockName;
        g.position = f.p1;
        g.scale = f.g41.value_or(1.0);
        g.rotation = degreesToRadians(f.g50.value_or(0.0));
        if (blocks_) {
            g.definition = blocks_->findShared(g.blockName);
            if (g.definition) {
                g.blockId = g.definition->id;
                rematerialize(g);
            }
        }
        return g;
    }

    IdSource& ids_;
    const LayerList& layers_;
    const BlockLibrary* blocks_;
    std::optional<RecordFields> pending_;
    DxfImportResult result_;
};

std::vector<std::string> splitLines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(std::move(line));
    return lines;
}

} // namespace

DxfImportResult importDxf(std::istream& in, IdSource& ids, const LayerList& layers, const BlockLibrary* blocks) {
    const std::vector<std::string> lines = splitLines(in);
    EntityImporter importer(ids, layers, blocks);

    std::size_t index = 0;
    bool inEntities = false;
    DxfPair pair;
    while (readPair(lines, index, pair)) {
        if (pair.code != 0) continue;

        if (pair.value == "SECTION") {
            const std::size_t saved = index;
            DxfPair name;
            if (readPair(lines, index, name) && name.code == 2) {
                inEntities = name.value == "ENTITIES";
            } else {
                index = saved;
            }
            continue;
        }
        if (pair.value == "ENDSEC") {
            if (inEntities) break;
            continue;
        }
        if (pair.value == "EOF") break;
        if (!inEntities) continue;

        const std::string type = toUpperAscii(pair.value);
        importer.handle(type, readRecordBody(lines, index));
    }
    return importer.finish();
}

DxfImportResult importDxf(const std::string& content, IdSource& ids, const LayerList& layers,
                          const BlockLibrary* blocks) {
    std::istringstream in(content);
    return importDxf(in, ids, layers, blocks);
}

} // namespace civcad
