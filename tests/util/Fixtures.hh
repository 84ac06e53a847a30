/* -- C++ -- */
/**
 *  @file  tests/util/Fixtures.hh
 *
 *  @brief Builders for data objects used across the tests.
 */

#ifndef EVE_TESTS_FIXTURES_H
#define EVE_TESTS_FIXTURES_H

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "DataFields.hh"
#include "DataSet.hh"
#include "MemoryReader.hh"

namespace eve
{
namespace test
{

/// Already materialised data object, as produced by an alignment.
inline DataSet make_set(Kind kind, const std::string &id, std::vector<std::int64_t> index, Column data)
{
    DataSet out(kind);
    out.metadata().id = id;
    out.metadata().name = id;
    out.assign(std::move(index), {{kDataField, std::move(data)}});
    return out;
}

inline DataSet make_floats(Kind kind, const std::string &id, std::vector<std::int64_t> index,
                           std::vector<double> values)
{
    return make_set(kind, id, std::move(index), Column(std::move(values)));
}

inline RawTable raw_table(const std::string &index_column,
                          std::vector<std::int64_t> index,
                          const std::string &value_column,
                          Column values)
{
    RawTable table;
    table.add(index_column, Column(std::move(index)));
    table.add(value_column, std::move(values));
    return table;
}

/// Data object loading through @p reader, as wired up from a catalog.
inline DataSet deferred_set(Kind kind,
                            const std::string &id,
                            const std::shared_ptr<MemoryReader> &reader,
                            std::vector<std::int64_t> index,
                            Column values)
{
    const bool by_time = kind == Kind::kMonitor;
    const std::string index_column = by_time ? "mSecsSinceStart" : "PosCounter";
    reader->put(id, raw_table(index_column, std::move(index), id, std::move(values)));

    DataImporter importer(reader, id);
    importer.map_column(index_column, by_time ? kMillisecondsField : kPositionField);
    importer.map_column(id, kDataField);

    DataSet out(kind);
    out.metadata().id = id;
    out.metadata().name = id;
    out.add_importer(std::move(importer));
    return out;
}

/// Timestamp table: position counts with the milliseconds they were reached.
inline DataSet timestamp_table(std::vector<std::int64_t> positions, std::vector<std::int64_t> milliseconds)
{
    DataSet out(Kind::kTimestamp);
    out.metadata().name = "Timestamp";
    out.assign(std::move(positions), {{kDataField, Column(std::move(milliseconds))}});
    return out;
}

} // namespace test
} // namespace eve

#endif // EVE_TESTS_FIXTURES_H
