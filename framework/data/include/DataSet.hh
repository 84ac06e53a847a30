/* -- C++ -- */
/**
 *  @file  data/include/DataSet.hh
 *
 *  @brief Value sequence recorded for one device: an index (position counts,
 *         or milliseconds for monitors) with parallel value fields, loaded
 *         and cleaned on first access.
 */

#ifndef EVE_DATA_DATA_SET_H
#define EVE_DATA_DATA_SET_H

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "Column.hh"
#include "DataImporter.hh"
#include "DataKind.hh"
#include "Metadata.hh"

namespace eve
{

/**
 *  Data of a single device.
 *
 *  A data object is created empty by the classification layer, carrying one
 *  importer per raw dataset its fields are spread over. The first call of
 *  any accessor (index(), data(), field(), size(), ...) reads the raw
 *  columns through the importers and applies the cleaning rules of the kind:
 *  position-indexed kinds are sorted stably by position count, then
 *  duplicate position counts are collapsed (axes keep the last entry,
 *  channels the first). The load happens exactly once, also under concurrent
 *  first access.
 *
 *  Once loaded, the shape only changes through assign(); joining never
 *  modifies a data object but returns new ones.
 */
class DataSet
{
  public:
    explicit DataSet(Kind kind = Kind::kDevice);

    DataSet(const DataSet &other);
    DataSet(DataSet &&other) noexcept;
    DataSet &operator=(const DataSet &other);
    DataSet &operator=(DataSet &&other) noexcept;
    ~DataSet() = default;

    Kind kind() const noexcept { return m_kind; }
    const KindTraits &traits() const { return kind_traits(m_kind); }

    ChannelMode channel_mode() const noexcept { return m_channel_mode; }
    bool normalized() const noexcept { return m_normalized; }
    void set_channel_mode(ChannelMode mode, bool normalized = false);

    Metadata &metadata() noexcept { return m_metadata; }
    const Metadata &metadata() const noexcept { return m_metadata; }

    void add_importer(DataImporter importer);
    const std::vector<DataImporter> &importers() const noexcept { return m_importers; }

    void ensure_loaded() const;
    bool is_loaded() const;

    const std::vector<std::int64_t> &index() const;
    const Column &data() const;
    const Column &field(const std::string &name) const;
    bool has_field(const std::string &name) const;
    std::vector<std::string> field_names() const;
    std::size_t size() const;

    /// Average and interval channels: the data values are the mean values.
    const Column &mean() const;

    /**
     *  Replace index and fields with already-materialised values. No cleaning
     *  is applied; all fields must have the length of the index.
     */
    void assign(std::vector<std::int64_t> index,
                std::vector<std::pair<std::string, Column>> fields);

    /// Timestamp tables only: position recorded at or before the given time.
    std::int64_t position_at(double milliseconds) const;
    std::vector<std::int64_t> positions_at(const std::vector<double> &milliseconds) const;

    std::string index_name() const;
    std::string label() const;
    std::string describe() const;

  private:
    void load_locked() const;
    void clean_locked() const;
    void check_shape_locked() const;

    Kind m_kind;
    ChannelMode m_channel_mode = ChannelMode::kSinglePoint;
    bool m_normalized = false;
    Metadata m_metadata;
    std::vector<DataImporter> m_importers;

    mutable std::mutex m_mutex;
    mutable bool m_loaded = false;
    mutable std::vector<std::int64_t> m_index;
    mutable std::vector<std::string> m_field_names;
    mutable std::vector<Column> m_fields;
};

} // namespace eve

#endif // EVE_DATA_DATA_SET_H
