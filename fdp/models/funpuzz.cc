#include <fdp/constraints/all_different.hh>
#include <fdp/constraints/cage.hh>
#include <fdp/constraints/not_equals.hh>
#include <fdp/exception.hh>
#include <fdp/models/funpuzz.hh>

#include <fmt/core.h>

#include <string>

using namespace fdp;

using std::move;
using std::pair;
using std::size_t;
using std::vector;

using fmt::format;

namespace
{
    auto decode_cell(long long code, int size) -> pair<int, int>
    {
        auto row = code / 10, col = code % 10;
        if (row < 1 || row > size || col < 1 || col > size)
            throw ModelException{format("cell {} is not in a {} by {} grid", code, size, size)};
        return pair{static_cast<int>(row - 1), static_cast<int>(col - 1)};
    }

    auto create_grid(const FunPuzz & puzzle) -> FunPuzzModel
    {
        FunPuzzModel result{CSP{format("funpuzz {}", puzzle.size)}, {}};
        for (int r = 0; r < puzzle.size; ++r) {
            result.grid.emplace_back();
            for (int c = 0; c < puzzle.size; ++c)
                result.grid.back().push_back(result.csp.create_variable(format("V{}{}", r + 1, c + 1), 1_v, Value{puzzle.size}));
        }
        return result;
    }

    auto add_binary_grid_constraints(FunPuzzModel & model, int size) -> void
    {
        auto & csp = model.csp;
        for (int i = 0; i < size; ++i)
            for (int j = 0; j < size; ++j)
                for (int k = j + 1; k < size; ++k) {
                    csp.add_constraint(not_equals(csp, model.grid[i][j], model.grid[i][k], format("Row {} {}{}", i, j, k)));
                    csp.add_constraint(not_equals(csp, model.grid[j][i], model.grid[k][i], format("Column {} {}{}", i, j, k)));
                }
    }

    auto add_all_different_grid_constraints(FunPuzzModel & model, int size) -> void
    {
        auto & csp = model.csp;
        for (int i = 0; i < size; ++i) {
            vector<VariableID> row, col;
            for (int j = 0; j < size; ++j) {
                row.push_back(model.grid[i][j]);
                col.push_back(model.grid[j][i]);
            }
            csp.add_constraint(all_different(csp, move(row), format("Row {}", i)));
            csp.add_constraint(all_different(csp, move(col), format("Col {}", i)));
        }
    }
}

auto fdp::parse_funpuzz(const vector<vector<long long>> & lists) -> FunPuzz
{
    if (lists.empty() || lists[0].size() != 1)
        throw ModelException{"a funpuzz must start with [size]"};
    if (lists[0][0] < 1 || lists[0][0] > 9)
        throw ModelException{format("funpuzz size {} is not between 1 and 9", lists[0][0])};

    FunPuzz result{static_cast<int>(lists[0][0]), {}};
    for (size_t i = 1; i < lists.size(); ++i) {
        auto & list = lists[i];
        if (list.size() < 2)
            throw ModelException{format("cage {} is too short", i)};

        if (list.size() == 2) {
            result.cages.push_back(FunPuzzCage{{decode_cell(list[0], result.size)}, Value{list[1]}, std::nullopt});
            continue;
        }

        auto op = cage_operation_from_code(list.back());
        if (! op)
            throw ModelException{format("cage {} has unknown operation {}", i, list.back())};

        FunPuzzCage cage{{}, Value{list[list.size() - 2]}, op};
        for (size_t c = 0; c + 2 < list.size(); ++c)
            cage.cells.push_back(decode_cell(list[c], result.size));
        result.cages.push_back(move(cage));
    }

    return result;
}

auto fdp::binary_ne_grid(const FunPuzz & puzzle) -> FunPuzzModel
{
    auto result = create_grid(puzzle);
    add_binary_grid_constraints(result, puzzle.size);
    return result;
}

auto fdp::nary_ad_grid(const FunPuzz & puzzle) -> FunPuzzModel
{
    auto result = create_grid(puzzle);
    add_all_different_grid_constraints(result, puzzle.size);
    return result;
}

auto fdp::caged_csp_model(const FunPuzz & puzzle, GridEncoding encoding) -> FunPuzzModel
{
    auto result = create_grid(puzzle);
    switch (encoding) {
    case GridEncoding::BinaryNotEquals: add_binary_grid_constraints(result, puzzle.size); break;
    case GridEncoding::AllDifferent: add_all_different_grid_constraints(result, puzzle.size); break;
    }

    for (size_t i = 0; i < puzzle.cages.size(); ++i) {
        auto & c = puzzle.cages[i];
        vector<VariableID> vars;
        for (auto & [r, col] : c.cells)
            vars.push_back(result.grid[r][col]);

        // a fixed cell is a one cell sum
        auto op = c.operation.value_or(CageOperation::Add);
        result.csp.add_constraint(cage(result.csp, move(vars), op, c.target, format("Cage {}", i + 1)));
    }

    return result;
}
