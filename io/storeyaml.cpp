#include "storeyaml.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "../errors.hpp"

namespace attribution {

namespace {

/* ---------- reading ------------------------------------------------------- */
cv::Point2d readPoint(const YAML::Node& n)
{
    const auto xy = n.as<std::vector<double>>();
    if (xy.size() != 2)
        throw std::invalid_argument("coordinate needs exactly two values");
    return {xy[0], xy[1]};
}

std::vector<cv::Point2d> readRing(const YAML::Node& n)
{
    std::vector<cv::Point2d> out;
    if (!n) return out;
    for (const auto& p : n)
        out.push_back(readPoint(p));
    return out;
}

template<typename T>
std::optional<T> readOpt(const YAML::Node& n, const char* key)
{
    if (!n[key] || n[key].IsNull()) return std::nullopt;
    return n[key].as<T>();
}

std::optional<cv::Point2d> readOptPoint(const YAML::Node& n, const char* key)
{
    if (!n[key] || n[key].IsNull()) return std::nullopt;
    return readPoint(n[key]);
}

Asset readAsset(const YAML::Node& n)
{
    Asset a;
    a.id                = n["id"].as<AssetId>();
    a.category          = n["category"].as<std::string>();
    a.geometry.vertices = readRing(n["geometry"]);
    a.ownership         = n["owner"] ? n["owner"].as<int>() : 0;
    a.waterType         = n["water_type"] ? n["water_type"].as<std::string>() : std::string();
    a.stage             = n["stage"] ? n["stage"].as<int>() : 0;
    a.lastEditor        = n["last_editor"] ? n["last_editor"].as<std::string>() : std::string();

    a.point        = readOptPoint(n, "point");
    a.lineStart    = readOptPoint(n, "line_start");
    a.lineEnd      = readOptPoint(n, "line_end");
    a.spatialStart = readOpt<std::string>(n, "spatial_start");
    a.spatialEnd   = readOpt<std::string>(n, "spatial_end");
    a.spatialId    = readOpt<std::string>(n, "spatial_id");
    a.facilityId   = readOpt<std::string>(n, "facility_id");
    a.endpointFrom = readOpt<std::string>(n, "from_mh");
    a.endpointTo   = readOpt<std::string>(n, "to_mh");
    a.elevation    = readOpt<double>(n, "elevation");
    return a;
}

/* ---------- writing ------------------------------------------------------- */
void emitPoint(YAML::Emitter& out, const cv::Point2d& p)
{
    out << YAML::Flow << YAML::BeginSeq << p.x << p.y << YAML::EndSeq;
}

void emitRing(YAML::Emitter& out, const std::vector<cv::Point2d>& ring)
{
    out << YAML::Flow << YAML::BeginSeq;
    for (const auto& p : ring)
        out << YAML::Flow << YAML::BeginSeq << p.x << p.y << YAML::EndSeq;
    out << YAML::EndSeq;
}

void emitOpt(YAML::Emitter& out, const char* key, const std::optional<std::string>& v)
{
    if (v) out << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << *v;
}

void emitOpt(YAML::Emitter& out, const char* key, const std::optional<cv::Point2d>& v)
{
    if (!v) return;
    out << YAML::Key << key << YAML::Value;
    emitPoint(out, *v);
}

void emitAsset(YAML::Emitter& out, const Asset& a)
{
    out << YAML::BeginMap;
    out << YAML::Key << "id"          << YAML::Value << a.id;
    out << YAML::Key << "category"    << YAML::Value << a.category;
    out << YAML::Key << "geometry"    << YAML::Value;
    emitRing(out, a.geometry.vertices);
    out << YAML::Key << "owner"       << YAML::Value << a.ownership;
    out << YAML::Key << "water_type"  << YAML::Value << YAML::DoubleQuoted << a.waterType;
    out << YAML::Key << "stage"       << YAML::Value << a.stage;
    out << YAML::Key << "last_editor" << YAML::Value << YAML::DoubleQuoted << a.lastEditor;

    emitOpt(out, "point",         a.point);
    emitOpt(out, "line_start",    a.lineStart);
    emitOpt(out, "line_end",      a.lineEnd);
    emitOpt(out, "spatial_start", a.spatialStart);
    emitOpt(out, "spatial_end",   a.spatialEnd);
    emitOpt(out, "spatial_id",    a.spatialId);
    emitOpt(out, "facility_id",   a.facilityId);
    emitOpt(out, "from_mh",       a.endpointFrom);
    emitOpt(out, "to_mh",         a.endpointTo);
    if (a.elevation)
        out << YAML::Key << "elevation" << YAML::Value << *a.elevation;
    out << YAML::EndMap;
}

} // namespace

InMemoryAssetStore readStore(const YAML::Node& root)
{
    if (!root || !root.IsMap())
        throw StoreUnavailable("store root is not a map");

    InMemoryAssetStore store;
    try {
        for (const auto& z : root["zones"])
            store.addZone(Zone{z["code"].as<std::string>(), readRing(z["ring"])});

        for (const auto& s : root["survey_nodes"])
            store.addSurveyNode(SurveyNode{s["id"].as<AssetId>(),
                                           {s["x"].as<double>(), s["y"].as<double>()},
                                           s["z"].as<double>()});

        for (const auto& n : root["assets"])
            store.insert(readAsset(n));
    } catch (const YAML::Exception& e) {
        throw StoreUnavailable(std::string("invalid store record: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw StoreUnavailable(std::string("invalid store record: ") + e.what());
    } catch (const MalformedGeometry& e) {
        throw StoreUnavailable(std::string("invalid zone: ") + e.what());
    }
    return store;
}

InMemoryAssetStore loadStore(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw StoreUnavailable("failed to load store '" + path + "': " + e.what());
    }
    return readStore(root);
}

std::string writeStore(const InMemoryAssetStore& store)
{
    YAML::Emitter out;
    out.SetDoublePrecision(15);
    out << YAML::BeginMap;

    out << YAML::Key << "zones" << YAML::Value << YAML::BeginSeq;
    for (const auto& z : store.zones())
    {
        out << YAML::BeginMap;
        out << YAML::Key << "code" << YAML::Value << YAML::DoubleQuoted << z.code;
        out << YAML::Key << "ring" << YAML::Value;
        emitRing(out, z.ring);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "survey_nodes" << YAML::Value << YAML::BeginSeq;
    for (const auto& kv : store.surveyNodes())
    {
        const SurveyNode& s = kv.second;
        out << YAML::Flow << YAML::BeginMap
            << YAML::Key << "id" << YAML::Value << s.id
            << YAML::Key << "x"  << YAML::Value << s.position.x
            << YAML::Key << "y"  << YAML::Value << s.position.y
            << YAML::Key << "z"  << YAML::Value << s.z
            << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "assets" << YAML::Value << YAML::BeginSeq;
    for (const auto& kv : store.assets())
        emitAsset(out, kv.second);
    out << YAML::EndSeq;

    out << YAML::EndMap;
    if (!out.good())
        throw StoreUnavailable("failed to serialize store: " + out.GetLastError());
    return std::string(out.c_str()) + "\n";
}

void saveStore(const InMemoryAssetStore& store, const std::string& path)
{
    const std::string text = writeStore(store);
    const std::string tmp  = path + ".tmp";

    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f)
            throw StoreUnavailable("cannot open '" + tmp + "' for writing");
        f << text;
        f.flush();
        if (!f)
            throw StoreUnavailable("failed to write '" + tmp + "'");
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec)
        throw StoreUnavailable("cannot replace '" + path + "': " + ec.message());
}

} // namespace attribution
