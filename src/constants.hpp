#ifndef __CORRMAP_CONSTANTS__H_
#define __CORRMAP_CONSTANTS__H_

// MWA legacy correlator geometry. These are fixed by the hardware.
const int N_ANTENNAS {128};
const int N_POLS {2};
const int N_POL_PRODUCTS {N_POLS * N_POLS};
const int N_PFB_INPUTS {N_ANTENNAS * N_POLS};
const int N_PFB_BLOCKS {4};
const int PFB_BLOCK_SIZE {N_PFB_INPUTS / N_PFB_BLOCKS};
const int N_BASELINES {(N_ANTENNAS + 1) * (N_ANTENNAS / 2)};
// number of complex values per (time step, fine channel) block
const int MAP_SIZE {N_BASELINES * N_POL_PRODUCTS};

#endif
