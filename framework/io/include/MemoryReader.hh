/* -- C++ -- */
/**
 *  @file  io/include/MemoryReader.hh
 *
 *  @brief Reader serving tables and attributes held in memory, keyed by
 *         locator. Counts the table reads it served.
 */

#ifndef EVE_IO_MEMORY_READER_H
#define EVE_IO_MEMORY_READER_H

#include <atomic>
#include <cstddef>
#include <map>
#include <string>

#include "DataReader.hh"

namespace eve
{

class MemoryReader final : public DataReader
{
  public:
    void put(const std::string &locator, RawTable table);
    void set_attribute(const std::string &locator, const std::string &key, const std::string &value);

    RawTable read(const std::string &locator) const override;
    std::map<std::string, std::string> attributes(const std::string &locator) const override;

    std::size_t read_count() const noexcept { return m_reads.load(); }

  private:
    std::map<std::string, RawTable> m_tables;
    std::map<std::string, std::map<std::string, std::string>> m_attributes;
    mutable std::atomic<std::size_t> m_reads{0};
};

} // namespace eve

#endif // EVE_IO_MEMORY_READER_H
