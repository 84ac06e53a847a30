/* -- C++ -- */
/**
 *  @file  io/src/TableExportIO.cpp
 *
 *  @brief Implementation of the ROOT and text exports of aligned data.
 */

#include "TableExportIO.hh"

#include <cctype>
#include <memory>
#include <set>
#include <stdexcept>

#include <TFile.h>
#include <TNamed.h>
#include <TObject.h>
#include <TTree.h>

#include "DataFields.hh"
#include "Errors.hh"
#include "Log.hh"

namespace eve
{

namespace
{

const std::vector<std::int64_t> &shared_index(const std::vector<DataSet> &aligned)
{
    if (aligned.empty())
    {
        throw InvalidArgument("TableExportIO: nothing to export");
    }
    const std::vector<std::int64_t> &index = aligned.front().index();
    for (const DataSet &data : aligned)
    {
        if (data.index() != index)
        {
            throw InvalidArgument("TableExportIO: " + data.label() +
                                  " is not aligned with " + aligned.front().label());
        }
    }
    return index;
}

struct BranchSlot
{
    TableExportIO::ColumnRef ref;
    bool text = false;
    double value = 0.0;
    std::string string_value;
    bool masked = false;
};

} // namespace

std::string TableExportIO::sanitise_root_key(std::string s)
{
    for (char &c : s)
    {
        const unsigned char u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || c == '_'))
            c = '_';
    }
    if (s.empty())
        s = "data";
    return s;
}

std::vector<TableExportIO::ColumnRef> TableExportIO::layout(const std::vector<DataSet> &aligned)
{
    std::vector<ColumnRef> out;
    for (const DataSet &data : aligned)
    {
        const std::string id = data.metadata().id.empty() ? data.metadata().name : data.metadata().id;
        for (const std::string &field : data.field_names())
        {
            ColumnRef ref;
            ref.branch = sanitise_root_key(field == kDataField ? id : id + "_" + field);
            ref.unit = field == kDataField ? data.metadata().unit : "";
            ref.column = &data.field(field);
            out.push_back(std::move(ref));
        }
    }

    // Every branch also owns "<branch>_masked"; "position" is the index.
    std::set<std::string> taken{"position"};
    for (const ColumnRef &ref : out)
    {
        if (!taken.insert(ref.branch).second || !taken.insert(ref.branch + "_masked").second)
        {
            throw InvalidArgument("TableExportIO: branch name " + ref.branch +
                                  " is used by more than one column");
        }
    }
    return out;
}

std::size_t TableExportIO::write_root(const std::vector<DataSet> &aligned,
                                      const std::string &out_path,
                                      const std::string &tree_name)
{
    const std::vector<std::int64_t> &index = shared_index(aligned);
    const std::vector<ColumnRef> refs = layout(aligned);

    std::unique_ptr<TFile> f(TFile::Open(out_path.c_str(), "RECREATE"));
    if (!f || f->IsZombie())
    {
        throw std::runtime_error("TableExportIO: failed to open output file: " + out_path);
    }
    f->cd();

    const std::string name = sanitise_root_key(tree_name);
    auto tree = std::make_unique<TTree>(name.c_str(), "Data aligned on position counts");
    tree->SetDirectory(f.get());

    Long64_t position = 0;
    tree->Branch("position", &position);

    std::vector<BranchSlot> slots(refs.size());
    for (std::size_t i = 0; i < refs.size(); ++i)
    {
        BranchSlot &slot = slots[i];
        slot.ref = refs[i];
        slot.text = slot.ref.column->type() == Column::Type::kText;
        if (slot.text)
            tree->Branch(slot.ref.branch.c_str(), &slot.string_value);
        else
            tree->Branch(slot.ref.branch.c_str(), &slot.value);
        tree->Branch((slot.ref.branch + "_masked").c_str(), &slot.masked);
    }

    for (std::size_t row = 0; row < index.size(); ++row)
    {
        position = static_cast<Long64_t>(index[row]);
        for (BranchSlot &slot : slots)
        {
            slot.masked = slot.ref.column->is_masked(row);
            if (slot.text)
                slot.string_value = slot.masked ? std::string() : slot.ref.column->texts()[row];
            else
                slot.value = slot.ref.column->as_double(row);
        }
        tree->Fill();
    }

    tree->Write("", TObject::kOverwrite);
    for (const BranchSlot &slot : slots)
    {
        if (!slot.ref.unit.empty())
        {
            const std::string key = slot.ref.branch + "_unit";
            TNamed(key.c_str(), slot.ref.unit.c_str()).Write(key.c_str(), TObject::kOverwrite);
        }
    }
    tree.reset();
    f->Close();

    log_stage("TableExportIO", "write_root",
              "out_file=" + out_path + " tree=" + name + " entries=" + format_count(static_cast<long long>(index.size())));
    return index.size();
}

std::size_t TableExportIO::write_tsv(const std::vector<DataSet> &aligned, std::ostream &out)
{
    const std::vector<std::int64_t> &index = shared_index(aligned);
    const std::vector<ColumnRef> refs = layout(aligned);

    out << "position";
    for (const ColumnRef &ref : refs)
        out << '\t' << ref.branch;
    out << '\n';

    for (std::size_t row = 0; row < index.size(); ++row)
    {
        out << index[row];
        for (const ColumnRef &ref : refs)
            out << '\t' << ref.column->as_string(row);
        out << '\n';
    }
    if (!out)
    {
        throw std::runtime_error("TableExportIO: failed to write text output");
    }
    return index.size();
}

} // namespace eve
