/* -- C++ -- */
/**
 *  @file  io/include/CatalogIO.hh
 *
 *  @brief JSON catalog describing the contents of a scan file. Building a
 *         scan file from it wires every data object to a deferred importer,
 *         so no values are read until they are first requested.
 */

#ifndef EVE_IO_CATALOG_IO_H
#define EVE_IO_CATALOG_IO_H

#include <memory>
#include <string>

#include "DataReader.hh"
#include "ScanFile.hh"

namespace eve
{

class CatalogIO
{
  public:
    /**
     *  Read a catalog from disk. The "file" key names the eveH5 file, resolved
     *  relative to the catalog's directory, which is read with Hdf5Reader.
     */
    static ScanFile read(const std::string &catalog_path);

    /// Build a scan file from catalog text, reading values through @p reader.
    static ScanFile parse(const std::string &text, std::shared_ptr<const DataReader> reader);

    /// Path of the data file named by a catalog, relative paths resolved
    /// against @p base_dir.
    static std::string data_file(const std::string &text, const std::string &base_dir);
};

} // namespace eve

#endif // EVE_IO_CATALOG_IO_H
