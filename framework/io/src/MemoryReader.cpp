/* -- C++ -- */
/**
 *  @file  io/src/MemoryReader.cpp
 *
 *  @brief Implementation of the in-memory reader.
 */

#include "MemoryReader.hh"

#include <stdexcept>
#include <utility>

namespace eve
{

void MemoryReader::put(const std::string &locator, RawTable table)
{
    m_tables[locator] = std::move(table);
}

void MemoryReader::set_attribute(const std::string &locator,
                                 const std::string &key,
                                 const std::string &value)
{
    m_attributes[locator][key] = value;
}

RawTable MemoryReader::read(const std::string &locator) const
{
    const auto it = m_tables.find(locator);
    if (it == m_tables.end())
    {
        throw std::runtime_error("MemoryReader: no table at " + locator);
    }
    ++m_reads;
    return it->second;
}

std::map<std::string, std::string> MemoryReader::attributes(const std::string &locator) const
{
    const auto it = m_attributes.find(locator);
    return it == m_attributes.end() ? std::map<std::string, std::string>{} : it->second;
}

} // namespace eve
