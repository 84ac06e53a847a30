/* -- C++ -- */
/**
 *  @file  io/include/Hdf5Reader.hh
 *
 *  @brief Reader for eveH5 scan files. Compound datasets yield one column
 *         per member, simple one-dimensional datasets a single column named
 *         after the dataset. The file is opened anew for every call so data
 *         objects only touch it when their values are first requested.
 */

#ifndef EVE_IO_HDF5_READER_H
#define EVE_IO_HDF5_READER_H

#include <map>
#include <string>
#include <vector>

#include "DataReader.hh"

namespace eve
{

class Hdf5Reader final : public DataReader
{
  public:
    explicit Hdf5Reader(std::string path);

    const std::string &path() const noexcept { return m_path; }

    RawTable read(const std::string &locator) const override;

    /// Attributes of a dataset or group ("/" for the file root) as text.
    std::map<std::string, std::string> attributes(const std::string &locator) const override;

    /// Full paths of all datasets in the file, depth first.
    std::vector<std::string> list_datasets() const;

    /// Text of an attribute value: valid UTF-8 is kept, anything else is
    /// taken as ISO-8859-1 and converted.
    static std::string decode_text(const std::string &raw, bool *fallback = nullptr);

  private:
    std::string m_path;
};

} // namespace eve

#endif // EVE_IO_HDF5_READER_H
