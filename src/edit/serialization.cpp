#include "tile_develop/edit/serialization.hpp"
#include "tile_develop/core/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <optional>
#include <type_traits>
#include <unordered_set>

namespace tile_develop::edit {

namespace {

// Bitmaps are stored as base64 of their float32 samples, row-major.
std::string encode_base64(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(len));
    out.resize(static_cast<size_t>(std::max(0, n)));
    return out;
}

std::optional<std::vector<unsigned char>> decode_base64(const std::string& text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
    const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (n < 0) {
        return std::nullopt;
    }
    size_t padding = 0;
    if (!text.empty() && text[text.size() - 1] == '=') ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

json point_to_json(const NormPoint& p) {
    return json::array({p.x, p.y});
}

NormPoint point_from_json(const json& j) {
    if (!j.is_array() || j.size() != 2) {
        throw ValidationError("point must be a two element array");
    }
    return NormPoint{j.at(0).get<float>(), j.at(1).get<float>()};
}

json node_to_json(const MaskNode& node, bool embed_bitmaps) {
    json j;
    j["type"] = mask_node_type(node);

    if (const auto* n = std::get_if<BitmapLeaf>(&node)) {
        const auto& b = n->bitmap;
        j["width"] = b.width;
        j["height"] = b.height;
        j["source"] = b.source;
        if (embed_bitmaps) {
            j["data"] = encode_base64(reinterpret_cast<const unsigned char*>(b.values->data()),
                                      static_cast<size_t>(b.values->size()) * sizeof(float));
        } else {
            j["digest"] = b.digest;
        }
    } else if (const auto* n = std::get_if<LinearGradientLeaf>(&node)) {
        j["start"] = point_to_json(n->start);
        j["end"] = point_to_json(n->end);
    } else if (const auto* n = std::get_if<RadialGradientLeaf>(&node)) {
        j["center"] = point_to_json(n->center);
        j["radius_x"] = n->radius_x;
        j["radius_y"] = n->radius_y;
        j["rotation"] = n->rotation_deg;
        j["feather"] = n->feather;
    } else if (const auto* n = std::get_if<BrushStrokesLeaf>(&node)) {
        json strokes = json::array();
        for (const auto& s : n->strokes) {
            json pts = json::array();
            for (const auto& p : s.points) {
                pts.push_back(point_to_json(p));
            }
            strokes.push_back({{"radius", s.radius},
                               {"hardness", s.hardness},
                               {"erase", s.erase},
                               {"points", pts}});
        }
        j["strokes"] = strokes;
    } else if (const auto* n = std::get_if<CombineNode>(&node)) {
        j["op"] = mask_op_name(n->op);
        j["lhs"] = n->lhs;
        j["rhs"] = n->rhs;
    } else if (const auto* n = std::get_if<InvertNode>(&node)) {
        j["input"] = n->input;
    }
    return j;
}

MaskNode node_from_json(const json& j) {
    const std::string type = j.at("type").get<std::string>();

    if (type == "bitmap") {
        const int w = j.at("width").get<int>();
        const int h = j.at("height").get<int>();
        if (w <= 0 || h <= 0) {
            throw ValidationError("bitmap dimensions must be positive");
        }
        auto bytes = decode_base64(j.at("data").get<std::string>());
        const size_t expected = static_cast<size_t>(w) * h * sizeof(float);
        if (!bytes || bytes->size() != expected) {
            throw ValidationError("bitmap data does not decode to " + std::to_string(w) + "x" +
                                  std::to_string(h) + " samples");
        }
        Matrix2Df values(h, w);
        std::memcpy(values.data(), bytes->data(), expected);
        return BitmapLeaf{make_mask_bitmap(values, j.value("source", std::string("bitmap")))};
    }
    if (type == "linear_gradient") {
        return LinearGradientLeaf{point_from_json(j.at("start")), point_from_json(j.at("end"))};
    }
    if (type == "radial_gradient") {
        RadialGradientLeaf n;
        n.center = point_from_json(j.at("center"));
        n.radius_x = j.at("radius_x").get<float>();
        n.radius_y = j.at("radius_y").get<float>();
        n.rotation_deg = j.value("rotation", 0.0f);
        n.feather = j.value("feather", 0.0f);
        return n;
    }
    if (type == "brush_strokes") {
        BrushStrokesLeaf n;
        for (const auto& sj : j.at("strokes")) {
            BrushStroke s;
            s.radius = sj.at("radius").get<float>();
            s.hardness = sj.value("hardness", 0.5f);
            s.erase = sj.value("erase", false);
            for (const auto& pj : sj.at("points")) {
                s.points.push_back(point_from_json(pj));
            }
            n.strokes.push_back(std::move(s));
        }
        return n;
    }
    if (type == "combine") {
        auto op = mask_op_from_name(j.at("op").get<std::string>());
        if (!op) {
            throw ValidationError("unknown combine op");
        }
        return CombineNode{*op, j.at("lhs").get<int>(), j.at("rhs").get<int>()};
    }
    if (type == "invert") {
        return InvertNode{j.at("input").get<int>()};
    }
    throw ValidationError("unknown mask node type '" + type + "'");
}

Mask mask_from_json(const json& j) {
    Mask m;
    m.opacity = j.value("opacity", 1.0f);
    m.feather_radius = j.value("feather_radius", 0);
    for (const auto& nj : j.at("nodes")) {
        m.nodes.push_back(node_from_json(nj));
    }
    validate_mask(m);
    return m;
}

class Loader {
public:
    explicit Loader(DeserializeReport* report) : report_(report) {}

    void warn(const std::string& msg) {
        std::cerr << "[EDIT] " << msg << std::endl;
        if (report_) {
            report_->warnings.push_back(msg);
        }
    }

    std::optional<Adjustment> adjustment(const json& j, const std::string& where) {
        if (!j.is_object() || !j.contains("kind") || !j["kind"].is_string()) {
            warn(where + ": adjustment without a kind, skipped");
            return std::nullopt;
        }
        const std::string kind = j["kind"].get<std::string>();
        auto adj = default_adjustment(kind);
        if (!adj) {
            warn(where + ": unknown adjustment kind '" + kind + "', skipped");
            return std::nullopt;
        }

        for_each_param(*adj, [&](const ParamSpec& spec, auto& value) {
            using T = std::decay_t<decltype(value)>;
            if (!j.contains(spec.name)) {
                return;
            }
            const json& v = j[spec.name];
            const std::string field = where + "." + kind + "." + spec.name;
            if (!v.is_number()) {
                warn(field + ": not a number, using identity");
                return;
            }
            const double d = v.get<double>();
            if constexpr (std::is_same_v<T, int>) {
                if (!std::isfinite(d) || d != std::floor(d) || d < spec.min || d > spec.max) {
                    warn(field + ": invalid value, using identity");
                    return;
                }
                value = static_cast<int>(d);
            } else {
                const float f = static_cast<float>(d);
                if (!std::isfinite(f) || f < spec.min || f > spec.max) {
                    warn(field + ": out of range, using identity");
                    return;
                }
                value = f;
            }
        });

        if (auto* curve = std::get_if<Curve>(&*adj)) {
            curve_fields(j, *curve, where);
        }
        if (auto* hsl = std::get_if<HslBand>(&*adj)) {
            if (j.contains("band")) {
                auto band = j["band"].is_string() ? hsl_band_from_name(j["band"].get<std::string>())
                                                  : std::nullopt;
                if (band) {
                    hsl->band = *band;
                } else {
                    warn(where + ".hsl_band.band: unknown band, using reds");
                }
            }
        }
        return adj;
    }

    void curve_fields(const json& j, Curve& curve, const std::string& where) {
        if (j.contains("channel")) {
            auto ch = j["channel"].is_string()
                          ? curve_channel_from_name(j["channel"].get<std::string>())
                          : std::nullopt;
            if (ch) {
                curve.channel = *ch;
            } else {
                warn(where + ".curve.channel: unknown channel, using rgb");
            }
        }
        if (!j.contains("points")) {
            return;
        }
        try {
            std::vector<CurvePoint> pts;
            for (const auto& pj : j.at("points")) {
                NormPoint p = point_from_json(pj);
                pts.push_back(CurvePoint{p.x, p.y});
            }
            validate_curve_points(pts);
            curve.points = std::move(pts);
        } catch (const std::exception& e) {
            warn(where + ".curve.points: " + std::string(e.what()) + ", using identity");
        }
    }

    std::vector<MaskLayer> masks(const json& j, const std::string& where) {
        std::vector<MaskLayer> layers;
        for (size_t i = 0; i < j.size(); ++i) {
            const std::string at = where + ".masks[" + std::to_string(i) + "]";
            try {
                const json& lj = j.at(i);
                MaskLayer layer;
                auto op = mask_op_from_name(lj.value("op", std::string("add")));
                if (!op) {
                    throw ValidationError("unknown mask layer op");
                }
                layer.op = *op;
                layer.mask = mask_from_json(lj.at("mask"));
                layers.push_back(std::move(layer));
            } catch (const std::exception& e) {
                warn(at + ": malformed mask (" + std::string(e.what()) + "), layer dropped");
            }
        }
        return layers;
    }

    AdjustmentGroup group(const json& j, size_t index, std::unordered_set<GroupId>& seen) {
        const std::string where = "groups[" + std::to_string(index) + "]";
        AdjustmentGroup g;

        if (j.contains("id") && j["id"].is_number_unsigned() && j["id"].get<GroupId>() != 0) {
            g.id = j["id"].get<GroupId>();
            if (!seen.insert(g.id).second) {
                warn(where + ": duplicate id " + std::to_string(g.id) + ", reassigned");
                g.id = 0;
            }
        } else {
            warn(where + ": missing or invalid id, reassigned");
        }

        if (j.contains("name") && j["name"].is_string()) {
            g.name = j["name"].get<std::string>();
        }
        if (j.contains("enabled")) {
            if (j["enabled"].is_boolean()) {
                g.enabled = j["enabled"].get<bool>();
            } else {
                warn(where + ".enabled: not a boolean, using true");
            }
        }
        if (j.contains("opacity")) {
            const json& o = j["opacity"];
            const float f = o.is_number() ? o.get<float>() : -1.0f;
            if (f >= 0.0f && f <= 1.0f) {
                g.opacity = f;
            } else {
                warn(where + ".opacity: invalid, using 1");
            }
        }

        if (j.contains("masks") && j["masks"].is_array() && !j["masks"].empty()) {
            g.masks = masks(j["masks"], where);
            // A local group never widens to the whole image.
            if (g.masks.empty()) {
                warn(where + ": no valid mask layer left, group disabled");
                g.enabled = false;
            }
        }

        if (j.contains("adjustments") && j["adjustments"].is_array()) {
            const auto& arr = j["adjustments"];
            for (size_t a = 0; a < arr.size(); ++a) {
                auto adj = adjustment(arr[a], where + ".adjustments[" + std::to_string(a) + "]");
                if (!adj) {
                    continue;
                }
                try {
                    check_geometry_placement(index, g.is_global(), g.adjustments, *adj);
                } catch (const ValidationError& e) {
                    warn(where + ".adjustments[" + std::to_string(a) + "]: " + e.what() +
                         ", dropped");
                    continue;
                }
                g.adjustments.push_back(std::move(*adj));
            }
        }
        return g;
    }

private:
    DeserializeReport* report_;
};

} // namespace

json adjustment_to_json(const Adjustment& adj) {
    json j;
    j["kind"] = kind_name(adj);
    for_each_param(adj, [&](const ParamSpec& spec, const auto& value) {
        j[spec.name] = value;
    });
    if (const auto* curve = std::get_if<Curve>(&adj)) {
        j["channel"] = curve_channel_name(curve->channel);
        json pts = json::array();
        for (const auto& p : curve->points) {
            pts.push_back(json::array({p.x, p.y}));
        }
        j["points"] = pts;
    }
    if (const auto* hsl = std::get_if<HslBand>(&adj)) {
        j["band"] = hsl_band_name(hsl->band);
    }
    return j;
}

json mask_to_json(const Mask& mask, bool embed_bitmaps) {
    json nodes = json::array();
    for (const auto& n : mask.nodes) {
        nodes.push_back(node_to_json(n, embed_bitmaps));
    }
    return {{"opacity", mask.opacity},
            {"feather_radius", mask.feather_radius},
            {"nodes", nodes}};
}

namespace {

json group_to_json(const AdjustmentGroup& g, bool embed_bitmaps) {
    json adjs = json::array();
    for (const auto& a : g.adjustments) {
        adjs.push_back(adjustment_to_json(a));
    }
    json masks = json::array();
    for (const auto& layer : g.masks) {
        masks.push_back({{"op", mask_op_name(layer.op)},
                         {"mask", mask_to_json(layer.mask, embed_bitmaps)}});
    }
    return {{"enabled", g.enabled},
            {"opacity", g.opacity},
            {"adjustments", adjs},
            {"masks", masks}};
}

} // namespace

json group_content_json(const AdjustmentGroup& group) {
    return group_to_json(group, false);
}

Document serialize(const EditState& state) {
    json groups = json::array();
    for (const auto& g : state.groups()) {
        json j = group_to_json(g, true);
        j["id"] = g.id;
        j["name"] = g.name;
        groups.push_back(std::move(j));
    }
    return {{"format", kDocumentFormat},
            {"version", kDocumentVersion},
            {"groups", groups}};
}

EditState deserialize(const Document& doc, DeserializeReport* report) {
    Loader loader(report);

    if (!doc.is_object()) {
        loader.warn("edit document is not an object, loading an empty edit");
        return EditState();
    }
    if (doc.value("format", std::string()) != kDocumentFormat) {
        loader.warn("unexpected document format '" + doc.value("format", std::string()) + "'");
    }
    if (doc.contains("version") && doc["version"].is_number_integer() &&
        doc["version"].get<int>() > kDocumentVersion) {
        loader.warn("document version " + std::to_string(doc["version"].get<int>()) +
                    " is newer than " + std::to_string(kDocumentVersion) +
                    ", unknown fields are ignored");
    }
    if (!doc.contains("groups") || !doc["groups"].is_array()) {
        loader.warn("document has no group list, loading an empty edit");
        return EditState();
    }

    std::vector<AdjustmentGroup> groups;
    std::unordered_set<GroupId> seen;
    for (const auto& gj : doc["groups"]) {
        if (!gj.is_object()) {
            loader.warn("groups[" + std::to_string(groups.size()) + "]: not an object, skipped");
            continue;
        }
        groups.push_back(loader.group(gj, groups.size(), seen));
    }
    return EditState::from_groups(std::move(groups));
}

std::string to_string(const EditState& state, int indent) {
    return serialize(state).dump(indent);
}

EditState from_string(const std::string& text, DeserializeReport* report) {
    Document doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("edit document is not valid JSON: ") + e.what());
    }
    return deserialize(doc, report);
}

} // namespace tile_develop::edit
