/* -- C++ -- */
/**
 *  @file  data/src/DataImporter.cpp
 *
 *  @brief Implementation of raw tables and the deferred-load descriptor.
 */

#include "DataImporter.hh"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "Errors.hh"

namespace eve
{

void RawTable::add(std::string name, Column column)
{
    names.push_back(std::move(name));
    columns.push_back(std::move(column));
}

bool RawTable::has(const std::string &name) const
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

const Column &RawTable::column(const std::string &name) const
{
    const auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end())
    {
        throw std::runtime_error("Missing column in raw table: " + name);
    }
    return columns[static_cast<std::size_t>(it - names.begin())];
}

std::size_t RawTable::rows() const
{
    return columns.empty() ? 0 : columns.front().size();
}

DataImporter::DataImporter(std::shared_ptr<const DataReader> reader, std::string locator)
    : m_reader(std::move(reader)), m_locator(std::move(locator))
{
}

void DataImporter::map_column(const std::string &column, const std::string &field)
{
    for (auto &entry : m_mapping)
    {
        if (entry.first == column)
        {
            entry.second = field;
            return;
        }
    }
    m_mapping.emplace_back(column, field);
}

RawTable DataImporter::load() const
{
    if (!m_reader)
    {
        throw MissingDependency("No reader provided to load data from.");
    }
    if (m_locator.empty())
    {
        throw InvalidArgument("No source provided to load data from.");
    }

    const RawTable raw = m_reader->read(m_locator);

    RawTable out;
    for (const auto &entry : m_mapping)
    {
        if (!raw.has(entry.first))
        {
            throw std::runtime_error("Dataset " + m_locator + " has no column " + entry.first);
        }
        out.add(entry.second, raw.column(entry.first));
    }
    return out;
}

} // namespace eve
