/* -- C++ -- */
/**
 *  @file  io/src/CatalogIO.cpp
 *
 *  @brief Implementation of the JSON catalog reader.
 */

#include "CatalogIO.hh"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "DataFields.hh"
#include "Errors.hh"
#include "Hdf5Reader.hh"
#include "Log.hh"

namespace eve
{

namespace
{

using nlohmann::json;

std::string text_or(const json &node, const char *key, const std::string &fallback = "")
{
    const auto it = node.find(key);
    if (it == node.end() || it->is_null())
        return fallback;
    if (it->is_string())
        return it->get<std::string>();
    return it->dump();
}

template <typename T>
T number_or(const json &node, const char *key, T fallback)
{
    const auto it = node.find(key);
    if (it == node.end() || !it->is_number())
        return fallback;
    return it->get<T>();
}

std::string required(const json &entry, const char *key, const std::string &where)
{
    const std::string value = text_or(entry, key);
    if (value.empty())
    {
        throw InvalidArgument("CatalogIO: entry in " + where + " lacks \"" + key + "\"");
    }
    return value;
}

std::vector<std::pair<std::string, std::string>> default_columns(Kind kind, const std::string &id)
{
    switch (kind)
    {
    case Kind::kMonitor:
        return {{"mSecsSinceStart", kMillisecondsField}, {id, kDataField}};
    case Kind::kTimestamp:
        return {{"PosCounter", kPositionField}, {"PosCountTimer", kDataField}};
    default:
        return {{"PosCounter", kPositionField}, {id, kDataField}};
    }
}

DataSet make_data_set(const json &entry,
                      Kind kind,
                      const std::shared_ptr<const DataReader> &reader,
                      const std::string &where)
{
    if (!entry.is_object())
    {
        throw InvalidArgument("CatalogIO: entries in " + where + " must be objects");
    }

    DataSet data(kind);
    Metadata &meta = data.metadata();
    meta.id = required(entry, "id", where);
    const std::string locator = required(entry, "locator", where);

    meta.name = text_or(entry, "name");
    meta.unit = text_or(entry, "unit");
    meta.pv = text_or(entry, "pv");
    meta.access_mode = text_or(entry, "access_mode");
    meta.deadband = number_or(entry, "deadband", 0.0);
    meta.n_averages = number_or(entry, "n_averages", 0);
    meta.low_limit = number_or(entry, "low_limit", 0.0);
    meta.max_attempts = number_or(entry, "max_attempts", 0);
    meta.max_deviation = number_or(entry, "max_deviation", 0.0);
    meta.trigger_interval = number_or(entry, "trigger_interval", 0.0);
    meta.normalize_id = text_or(entry, "normalize_id");

    const auto options = entry.find("options");
    if (options != entry.end() && options->is_object())
    {
        for (auto it = options->begin(); it != options->end(); ++it)
        {
            meta.options[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                            : it.value().dump();
        }
    }

    if (kind == Kind::kChannel)
    {
        const bool normalized = entry.value("normalized", false) || !meta.normalize_id.empty();
        data.set_channel_mode(parse_channel_mode(text_or(entry, "channel_mode")), normalized);
    }

    if ((meta.name.empty() || meta.unit.empty()) && reader)
    {
        const std::map<std::string, std::string> attrs = reader->attributes(locator);
        const auto name = attrs.find("Name");
        const auto unit = attrs.find("Unit");
        if (meta.name.empty() && name != attrs.end())
            meta.name = name->second;
        if (meta.unit.empty() && unit != attrs.end())
            meta.unit = unit->second;
    }

    DataImporter importer(reader, locator);
    const auto columns = entry.find("columns");
    if (columns != entry.end() && columns->is_object())
    {
        for (auto it = columns->begin(); it != columns->end(); ++it)
        {
            importer.map_column(it.key(), it.value().get<std::string>());
        }
    }
    else
    {
        for (const auto &mapping : default_columns(kind, meta.id))
        {
            importer.map_column(mapping.first, mapping.second);
        }
    }
    data.add_importer(std::move(importer));
    return data;
}

void read_collection(const json &doc,
                     const char *key,
                     const std::shared_ptr<const DataReader> &reader,
                     ScanFile::Collection &out,
                     bool monitors)
{
    const auto node = doc.find(key);
    if (node == doc.end())
        return;
    if (!node->is_array())
    {
        throw InvalidArgument(std::string("CatalogIO: \"") + key + "\" must be an array");
    }
    for (const json &entry : *node)
    {
        const Kind kind = monitors ? Kind::kMonitor : parse_kind(required(entry, "kind", key));
        if (kind == Kind::kMonitor && !monitors)
        {
            throw InvalidArgument(std::string("CatalogIO: monitors belong in \"monitors\", found one in \"") +
                                  key + "\"");
        }
        DataSet data = make_data_set(entry, kind, reader, key);
        const std::string id = data.metadata().id;
        out.erase(id);
        out.emplace(id, std::move(data));
    }
}

FileMetadata read_metadata(const json &doc)
{
    FileMetadata meta;
    const auto node = doc.find("metadata");
    if (node == doc.end())
        return meta;
    const json &m = *node;
    meta.filename = text_or(m, "filename", text_or(doc, "file"));
    meta.eveh5_version = text_or(m, "eveh5_version");
    meta.eve_version = text_or(m, "eve_version");
    meta.xml_version = text_or(m, "xml_version");
    meta.measurement_station = text_or(m, "measurement_station");
    meta.start = text_or(m, "start");
    meta.end = text_or(m, "end");
    meta.description = text_or(m, "description");
    meta.simulation = m.value("simulation", false);
    meta.preferred_axis = text_or(m, "preferred_axis");
    meta.preferred_channel = text_or(m, "preferred_channel");
    meta.preferred_normalisation_channel = text_or(m, "preferred_normalisation_channel");
    return meta;
}

json parse_document(const std::string &text)
{
    try
    {
        json doc = json::parse(text);
        if (!doc.is_object())
        {
            throw InvalidArgument("CatalogIO: catalog must be a JSON object");
        }
        return doc;
    }
    catch (const json::exception &e)
    {
        throw InvalidArgument(std::string("CatalogIO: malformed catalog: ") + e.what());
    }
}

std::string slurp(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw std::runtime_error("CatalogIO: failed to open catalog: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

ScanFile CatalogIO::parse(const std::string &text, std::shared_ptr<const DataReader> reader)
{
    const json doc = parse_document(text);

    ScanFile file;
    try
    {
        file.metadata = read_metadata(doc);
        if (file.metadata.filename.empty())
            file.metadata.filename = text_or(doc, "file");

        const auto logs = doc.find("log_messages");
        if (logs != doc.end() && logs->is_array())
        {
            for (const json &line : *logs)
            {
                file.log_messages.push_back(LogMessage::from_string(line.get<std::string>()));
            }
        }

        read_collection(doc, "data", reader, file.data, false);
        read_collection(doc, "snapshots", reader, file.snapshots, false);
        read_collection(doc, "monitors", reader, file.monitors, true);

        const auto timestamps = doc.find("timestamps");
        if (timestamps != doc.end() && !timestamps->is_null())
        {
            file.position_timestamps = std::make_shared<DataSet>(
                make_data_set(*timestamps, Kind::kTimestamp, reader, "timestamps"));
        }
    }
    catch (const json::exception &e)
    {
        throw InvalidArgument(std::string("CatalogIO: malformed entry: ") + e.what());
    }

    log_debug("CatalogIO", "action=parse data=" + std::to_string(file.data.size()) +
                               " snapshots=" + std::to_string(file.snapshots.size()) +
                               " monitors=" + std::to_string(file.monitors.size()));
    return file;
}

std::string CatalogIO::data_file(const std::string &text, const std::string &base_dir)
{
    const json doc = parse_document(text);
    const std::string name = text_or(doc, "file");
    if (name.empty())
    {
        throw InvalidArgument("CatalogIO: catalog does not name a data file");
    }
    const std::filesystem::path path(name);
    if (path.is_absolute() || base_dir.empty())
        return path.string();
    return (std::filesystem::path(base_dir) / path).string();
}

ScanFile CatalogIO::read(const std::string &catalog_path)
{
    const std::string text = slurp(catalog_path);
    const std::string base_dir = std::filesystem::path(catalog_path).parent_path().string();
    const std::string h5_path = data_file(text, base_dir);
    log_stage("CatalogIO", "read", "catalog=" + catalog_path + " file=" + h5_path);

    ScanFile file = parse(text, std::make_shared<Hdf5Reader>(h5_path));
    if (file.metadata.filename.empty())
        file.metadata.filename = h5_path;
    return file;
}

} // namespace eve
