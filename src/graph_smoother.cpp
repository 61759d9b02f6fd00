#include "graph_smoother.hpp"
#include "mesh_graph.hpp"
#include "remap_errors.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

void GraphSmoother::validate(const FieldRule& rule, int iterations)
{
    if (iterations < 0) {
        throw ConfigurationError("smoothing iteration count must be >= 0, got " +
                                 std::to_string(iterations));
    }
    if (iterations > 0 && !rule.smoothable) {
        throw ConfigurationError("smoothing is only defined for beta and stiffnessFactor, not '" +
                                 rule.name + "'; set the iteration count to 0 to disable it");
    }
}

std::vector<NeighborStencil> GraphSmoother::build_stencils(const ActiveMask& original,
                                                           const ActiveMask& current) const
{
    std::vector<NeighborStencil> stencils;
    const int n = static_cast<int>(graph_.num_cells());
    for (int c = 0; c < n; ++c) {
        if (original[c]) continue;

        NeighborStencil s;
        if (s.build(rule_.smoothing_rule, graph_, c, current) == 0) {
            // Extrapolation saturates the mask, so this is an upstream defect.
            std::stringstream ss;
            ss << "cell " << c + 1 << " has no active neighbour during smoothing";
            throw TopologyError(ss.str());
        }
        stencils.push_back(std::move(s));
    }
    return stencils;
}

void GraphSmoother::smooth(CellField& field, const ActiveMask& original, const ActiveMask& current,
                           int iterations) const
{
    validate(rule_, iterations);
    if (iterations == 0) {
        std::cout << "[SMOOTH] No smoothing! Iter number is 0!\n";
        return;
    }

    const size_t n = graph_.num_cells();
    if (original.size() != n || current.size() != n || field.num_cells() != n) {
        throw TopologyError("smoothing masks or field do not match the graph");
    }

    const std::vector<NeighborStencil> stencils = build_stencils(original, current);
    std::cout << "[SMOOTH] " << stencils.size() << " cells, " << iterations << " iterations, rule "
              << neighbor_rule_name(rule_.smoothing_rule) << "\n";
    if (stencils.empty()) return;

    if (rule_.smoothing_rule == NeighborRule::Minimum) {
        smooth_minimum(field, stencils, iterations);
        return;
    }

    Mat W = nullptr;
    PetscErrorCode ierr = assemble_operator(stencils, W);
    if (ierr == 0) ierr = apply_operator(W, field, iterations);
    MatDestroy(&W);
    if (ierr != 0) {
        throw std::runtime_error("PETSc failure " + std::to_string(static_cast<int>(ierr)) +
                                 " while smoothing " + rule_.name);
    }
}

void GraphSmoother::smooth_minimum(CellField& field, const std::vector<NeighborStencil>& stencils,
                                   int iterations) const
{
    for (int it = 0; it < iterations; ++it) {
        const CellField snapshot = field;
        for (const auto& s : stencils) {
            for (int level = 0; level < field.n_levels; ++level) {
                field.at(s.cell, level) = s.apply(NeighborRule::Minimum, snapshot, level);
            }
        }
        std::cout << "[SMOOTH] " << std::setw(3) << it << " smoothing in total "
                  << std::setw(3) << iterations << " iters\n";
    }
}

// ============================================================================
// Inverse-distance operator
// ============================================================================
// Row c of W holds the normalised 1/d weights of c's donors when c is smoothed,
// and a single 1 on the diagonal otherwise. Rows sum to 1.

PetscErrorCode GraphSmoother::assemble_operator(const std::vector<NeighborStencil>& stencils, Mat& W) const
{
    const PetscInt n = static_cast<PetscInt>(graph_.num_cells());
    const PetscInt nz = static_cast<PetscInt>(graph_.max_degree()) + 1;

    PetscErrorCode ierr;
    ierr = MatCreateSeqAIJ(PETSC_COMM_SELF, n, n, nz, nullptr, &W); CHKERRQ(ierr);

    std::vector<bool> smoothed(graph_.num_cells(), false);
    std::vector<PetscInt> cols;
    std::vector<PetscScalar> vals;
    for (const auto& s : stencils) {
        smoothed[s.cell] = true;
        const PetscInt row = static_cast<PetscInt>(s.cell);
        cols.assign(s.donors.begin(), s.donors.end());
        vals.resize(s.donors.size());
        for (size_t k = 0; k < s.donors.size(); ++k) vals[k] = s.weights(static_cast<Eigen::Index>(k));
        ierr = MatSetValues(W, 1, &row, static_cast<PetscInt>(cols.size()), cols.data(),
                            vals.data(), INSERT_VALUES); CHKERRQ(ierr);
    }
    for (PetscInt row = 0; row < n; ++row) {
        if (smoothed[row]) continue;
        ierr = MatSetValue(W, row, row, 1.0, INSERT_VALUES); CHKERRQ(ierr);
    }

    ierr = MatAssemblyBegin(W, MAT_FINAL_ASSEMBLY); CHKERRQ(ierr);
    ierr = MatAssemblyEnd(W, MAT_FINAL_ASSEMBLY); CHKERRQ(ierr);
    return 0;
}

PetscErrorCode GraphSmoother::apply_operator(const Mat& W, CellField& field, int iterations) const
{
    const PetscInt n = static_cast<PetscInt>(graph_.num_cells());

    PetscErrorCode ierr;
    Vec v = nullptr, w = nullptr;
    ierr = VecCreateSeq(PETSC_COMM_SELF, n, &v); CHKERRQ(ierr);
    ierr = VecDuplicate(v, &w);
    if (ierr == 0) ierr = apply_levels(W, v, w, field, iterations);

    // Released on every path; the first failure is the one reported.
    PetscErrorCode destroy_v = VecDestroy(&v);
    PetscErrorCode destroy_w = w ? VecDestroy(&w) : 0;
    CHKERRQ(ierr);
    CHKERRQ(destroy_v);
    CHKERRQ(destroy_w);
    return 0;
}

PetscErrorCode GraphSmoother::apply_levels(const Mat& W, Vec v, Vec w, CellField& field, int iterations) const
{
    const PetscInt n = static_cast<PetscInt>(graph_.num_cells());

    PetscErrorCode ierr;
    for (int level = 0; level < field.n_levels; ++level) {
        PetscScalar* arr;
        ierr = VecGetArray(v, &arr); CHKERRQ(ierr);
        for (PetscInt i = 0; i < n; ++i) arr[i] = field.at(static_cast<size_t>(i), level);
        ierr = VecRestoreArray(v, &arr); CHKERRQ(ierr);

        for (int it = 0; it < iterations; ++it) {
            ierr = MatMult(W, v, w); CHKERRQ(ierr);
            ierr = VecSwap(v, w); CHKERRQ(ierr);
            if (level == 0) {
                std::cout << "[SMOOTH] " << std::setw(3) << it << " smoothing in total "
                          << std::setw(3) << iterations << " iters\n";
            }
        }

        const PetscScalar* out;
        ierr = VecGetArrayRead(v, &out); CHKERRQ(ierr);
        for (PetscInt i = 0; i < n; ++i) field.at(static_cast<size_t>(i), level) = PetscRealPart(out[i]);
        ierr = VecRestoreArrayRead(v, &out); CHKERRQ(ierr);
    }
    return 0;
}
