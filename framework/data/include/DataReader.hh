/* -- C++ -- */
/**
 *  @file  data/include/DataReader.hh
 *
 *  @brief Reader capability consumed by the data model: raw named columns and
 *         string attributes addressed by an opaque locator.
 */

#ifndef EVE_DATA_DATA_READER_H
#define EVE_DATA_DATA_READER_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "Column.hh"

namespace eve
{

struct RawTable
{
    std::vector<std::string> names;
    std::vector<Column> columns;

    void add(std::string name, Column column);
    bool has(const std::string &name) const;
    const Column &column(const std::string &name) const;
    std::size_t rows() const;
};

class DataReader
{
  public:
    virtual ~DataReader() = default;

    virtual RawTable read(const std::string &locator) const = 0;
    virtual std::map<std::string, std::string> attributes(const std::string &locator) const = 0;
};

} // namespace eve

#endif // EVE_DATA_DATA_READER_H
