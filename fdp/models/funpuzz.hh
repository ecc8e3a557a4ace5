#ifndef FINITE_DOMAIN_PROPAGATION_GUARD_FDP_MODELS_FUNPUZZ_HH
#define FINITE_DOMAIN_PROPAGATION_GUARD_FDP_MODELS_FUNPUZZ_HH 1

#include <fdp/constraints/cage.hh>
#include <fdp/csp.hh>
#include <fdp/value.hh>
#include <fdp/variable_id.hh>

#include <optional>
#include <utility>
#include <vector>

namespace fdp
{
    /**
     * \defgroup Models Puzzle models
     */

    /**
     * \brief A cage in a FunPuzz. Cells are (row, column), counting from
     * zero. If there is no operation, the cage has a single cell whose value
     * is given by the target.
     *
     * \ingroup Models
     */
    struct FunPuzzCage final
    {
        std::vector<std::pair<int, int>> cells;
        Value target;
        std::optional<CageOperation> operation;
    };

    /**
     * \brief A FunPuzz: fill a size by size grid with 1 to size, so that no
     * row or column repeats a value, and so that every cage's cells combine to
     * its target.
     *
     * \ingroup Models
     */
    struct FunPuzz final
    {
        int size;
        std::vector<FunPuzzCage> cages;
    };

    /**
     * \brief Decode the list-of-lists FunPuzz format.
     *
     * The first list is [size]. Every other list is a cage, either
     * [cell, target] for a single fixed cell, or [cell, ..., cell, target,
     * operation], where a cell is the two digit number rc with row and column
     * counted from one, and the operation is as for
     * fdp::cage_operation_from_code(). Throws ModelException if anything does
     * not fit.
     *
     * \ingroup Models
     */
    [[nodiscard]] auto parse_funpuzz(const std::vector<std::vector<long long>> &) -> FunPuzz;

    /**
     * \brief How row and column constraints are expressed.
     *
     * \ingroup Models
     */
    enum class GridEncoding
    {
        BinaryNotEquals,
        AllDifferent
    };

    /**
     * \brief A compiled FunPuzz. The grid gives the variable for each cell,
     * indexed by row then column.
     *
     * \ingroup Models
     */
    struct FunPuzzModel final
    {
        CSP csp;
        std::vector<std::vector<VariableID>> grid;
    };

    /**
     * \brief Just the grid, using a not-equals constraint for every pair of
     * cells sharing a row or a column. Cages are ignored.
     *
     * \ingroup Models
     */
    [[nodiscard]] auto binary_ne_grid(const FunPuzz &) -> FunPuzzModel;

    /**
     * \brief Just the grid, using one all-different constraint per row and
     * per column. Cages are ignored.
     *
     * \ingroup Models
     */
    [[nodiscard]] auto nary_ad_grid(const FunPuzz &) -> FunPuzzModel;

    /**
     * \brief The grid, encoded as requested, plus a constraint for every
     * cage. A single fixed cell gets a unary constraint on the existing cell
     * variable.
     *
     * \ingroup Models
     */
    [[nodiscard]] auto caged_csp_model(const FunPuzz &, GridEncoding = GridEncoding::BinaryNotEquals) -> FunPuzzModel;
}

#endif
