/* -- C++ -- */
/**
 *  @file  io/include/TableExportIO.hh
 *
 *  @brief Export of aligned data objects sharing one position index, either
 *         as a ROOT tree or as tab-separated text.
 */

#ifndef EVE_IO_TABLE_EXPORT_IO_H
#define EVE_IO_TABLE_EXPORT_IO_H

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "DataSet.hh"

namespace eve
{

class TableExportIO
{
  public:
    struct ColumnRef
    {
        std::string branch;
        std::string unit;
        const Column *column = nullptr;
    };

    static std::string sanitise_root_key(std::string s);

    /// Branch layout of the export: the data field of every object under
    /// its id, further fields as "<id>_<field>". Throws InvalidArgument
    /// when two columns end up with the same branch name.
    static std::vector<ColumnRef> layout(const std::vector<DataSet> &aligned);

    /**
     *  Write one entry per common position. Every value branch is paired
     *  with a "<branch>_masked" flag; units go alongside as TNamed objects
     *  named "<branch>_unit". Returns the number of entries written.
     */
    static std::size_t write_root(const std::vector<DataSet> &aligned,
                                  const std::string &out_path,
                                  const std::string &tree_name = "joined");

    static std::size_t write_tsv(const std::vector<DataSet> &aligned, std::ostream &out);
};

} // namespace eve

#endif // EVE_IO_TABLE_EXPORT_IO_H
