/* -- C++ -- */
/**
 *  @file  tests/test_column.cpp
 *
 *  @brief Typed columns with a parallel mask: gathering, masking, splicing.
 */

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "Column.hh"
#include "Errors.hh"
#include "util/TestCheck.hh"

using namespace eve;

namespace
{

int test_masked_slots_are_distinct_from_values()
{
    const Column zeros(std::vector<double>{0.0, 0.0});
    Column masked = Column::masked(Column::Type::kFloat, 2);
    EVE_CHECK(masked.size() == 2);
    EVE_CHECK(masked.masked_count() == 2);
    EVE_CHECK(masked != zeros);
    EVE_CHECK(std::isnan(masked.as_double(0)));
    EVE_CHECK(masked.as_string(1) == "--");

    const Column texts(std::vector<std::string>{"", "a"});
    EVE_CHECK(!texts.has_mask());
    EVE_CHECK(Column::masked(Column::Type::kText, 2) != texts);
    return 0;
}

int test_take_or_mask()
{
    const Column values(std::vector<std::int64_t>{10, 20, 30});
    const Column out = values.take_or_mask({-1, 0, 0, 2, -1});
    EVE_CHECK(out.size() == 5);
    EVE_CHECK(out.is_masked(0));
    EVE_CHECK(!out.is_masked(1));
    EVE_CHECK(out.integers()[1] == 10);
    EVE_CHECK(out.integers()[2] == 10);
    EVE_CHECK(out.integers()[3] == 30);
    EVE_CHECK(out.is_masked(4));
    EVE_CHECK(out.masked_count() == 2);

    Column partly = values;
    partly.mask_at(1);
    const Column again = partly.take_or_mask({1, 2});
    EVE_CHECK(again.is_masked(0));
    EVE_CHECK(!again.is_masked(1));

    EVE_CHECK_THROWS(values.take_or_mask({3}), std::out_of_range);
    return 0;
}

int test_take_without_masked_rows_drops_mask()
{
    Column values(std::vector<double>{1.0, 2.0, 3.0});
    values.mask_at(0);
    const Column out = values.take({1, 2});
    EVE_CHECK(!out.has_mask());
    EVE_CHECK(out.floats() == (std::vector<double>{2.0, 3.0}));
    return 0;
}

int test_splice_inserts_before_rows()
{
    const Column base(std::vector<std::int64_t>{3, 4, 5, 6});
    const Column spliced = base.splice({0, 4}, Column(std::vector<std::int64_t>{1, 7}));
    EVE_CHECK(spliced.integers() == (std::vector<std::int64_t>{1, 3, 4, 5, 6, 7}));

    const Column same_row = base.splice({2, 2}, Column(std::vector<std::int64_t>{40, 41}));
    EVE_CHECK(same_row.integers() == (std::vector<std::int64_t>{3, 4, 40, 41, 5, 6}));
    return 0;
}

int test_splice_promotes_and_rejects()
{
    const Column ints(std::vector<std::int64_t>{1, 2});
    const Column mixed = ints.splice({1}, Column(std::vector<double>{1.5}));
    EVE_CHECK(mixed.type() == Column::Type::kFloat);
    EVE_CHECK(mixed.floats() == (std::vector<double>{1.0, 1.5, 2.0}));

    const Column with_gap = ints.splice({2}, Column::masked(Column::Type::kInteger, 1));
    EVE_CHECK(with_gap.is_masked(2));
    EVE_CHECK(!with_gap.is_masked(0));

    EVE_CHECK_THROWS(ints.splice({0}, Column(std::vector<std::string>{"x"})), InvalidArgument);
    EVE_CHECK_THROWS(ints.splice({0, 1}, Column(std::vector<std::int64_t>{1})), InvalidArgument);
    EVE_CHECK_THROWS(ints.splice({3}, Column(std::vector<std::int64_t>{1})), InvalidArgument);
    return 0;
}

int test_typed_access()
{
    const Column texts(std::vector<std::string>{"on", "off"});
    EVE_CHECK(texts.type() == Column::Type::kText);
    EVE_CHECK(texts.as_string(1) == "off");
    EVE_CHECK_THROWS(texts.floats(), InvalidArgument);
    EVE_CHECK_THROWS(texts.as_double(0), InvalidArgument);
    EVE_CHECK_THROWS(texts.is_masked(2), std::out_of_range);

    const Column floats(std::vector<double>{0.25});
    EVE_CHECK(floats.as_string(0) == "0.25");
    EVE_CHECK_THROWS(floats.integers(), InvalidArgument);
    return 0;
}

} // namespace

int main()
{
    EVE_RUN(test_masked_slots_are_distinct_from_values);
    EVE_RUN(test_take_or_mask);
    EVE_RUN(test_take_without_masked_rows_drops_mask);
    EVE_RUN(test_splice_inserts_before_rows);
    EVE_RUN(test_splice_promotes_and_rejects);
    EVE_RUN(test_typed_access);
    return 0;
}
