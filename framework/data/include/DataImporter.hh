/* -- C++ -- */
/**
 *  @file  data/include/DataImporter.hh
 *
 *  @brief Deferred-load descriptor: where the raw columns of a data object
 *         live and which field each of them becomes once read.
 */

#ifndef EVE_DATA_DATA_IMPORTER_H
#define EVE_DATA_DATA_IMPORTER_H

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "DataReader.hh"

namespace eve
{

class DataImporter
{
  public:
    DataImporter() = default;
    DataImporter(std::shared_ptr<const DataReader> reader, std::string locator);

    void map_column(const std::string &column, const std::string &field);

    const std::string &locator() const noexcept { return m_locator; }
    const std::vector<std::pair<std::string, std::string>> &mapping() const noexcept { return m_mapping; }
    bool has_reader() const noexcept { return static_cast<bool>(m_reader); }

    /// Read the mapped columns, renamed to their field names.
    RawTable load() const;

  private:
    std::shared_ptr<const DataReader> m_reader;
    std::string m_locator;
    std::vector<std::pair<std::string, std::string>> m_mapping;
};

} // namespace eve

#endif // EVE_DATA_DATA_IMPORTER_H
