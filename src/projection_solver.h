// Incompressibility projection by Gauss-Seidel / SOR relaxation of cell divergence.
//
// Each iteration visits Fluid cells row by row. For cell (i,j) with open
// (non-solid) neighbor count n = sL + sR + sB + sT and divergence d, the faces
// shared with open neighbors are moved by omega * d / n so that d shrinks:
//   u(i,j)   += c * sL      u(i+1,j) -= c * sR
//   v(i,j)   += c * sB      v(i,j+1) -= c * sT      with c = omega * d / n
// Cells with n == 0 are skipped. The accumulated correction is stored in the
// grid's pressure buffer. Cost is fixed by the iteration count.
// With overrelaxation above 1, coupled Fluid cells can see the summed |div|
// rise for a single sweep; only the result of the whole run is reduced.
#pragma once

class Grid;

void solveIncompressibility(Grid& grid, int iterations, float overrelaxation);
