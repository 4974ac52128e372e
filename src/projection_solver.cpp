#include "projection_solver.h"
#include "grid.h"

void solveIncompressibility(Grid& grid, int iterations, float overrelaxation) {
    const int nx = grid.width();
    const int ny = grid.height();
    for (int it = 0; it < iterations; ++it) {
        for (int j = 1; j < ny - 1; ++j) {
            for (int i = 1; i < nx - 1; ++i) {
                if (grid.cellType(i,j) != CellType::Fluid) continue;

                float sL = grid.openness(i-1, j);
                float sR = grid.openness(i+1, j);
                float sB = grid.openness(i, j-1);
                float sT = grid.openness(i, j+1);
                float n = sL + sR + sB + sT;
                if (n == 0.0f) continue;

                float d = grid.divergence(i, j);
                float c = overrelaxation * d / n;

                grid.pressure(i, j) -= c;
                grid.u(i, j)   += c * sL;
                grid.u(i+1, j) -= c * sR;
                grid.v(i, j)   += c * sB;
                grid.v(i, j+1) -= c * sT;
            }
        }
    }
}
