#ifndef __CORRMAP_BASELINE_MAP__H_
#define __CORRMAP_BASELINE_MAP__H_

#include <vector>
#include <memory_buffer.hpp>
#include "constants.hpp"
#include "antenna_mapping.hpp"


/**
 * Position of a visibility in the raw correlator block, and whether the value
 * stored there is the complex conjugate of the requested one.
 */
struct CorrelatorIndex {
    int offset;
    bool conjugate;
};


/**
 * Lookup tables translating the standard (baseline, polarisation product) order into
 * the correlator storage order. Both are indexed by `baseline * 4 + 2 * p1 + p2`.
 */
struct BaselineMap {
    MemoryBuffer<int> map_inds;
    MemoryBuffer<bool> conj;
};


/**
 * @brief Index of the baseline (ant1, ant2), ant1 <= ant2, in the upper triangular
 * enumeration (0,0), (0,1), ..., (0,127), (1,1), ..., (127,127).
 */
inline int get_baseline_index(int ant1, int ant2){
    return N_ANTENNAS * ant1 - (ant1 * (ant1 + 1)) / 2 + ant2;
}


/**
 * @brief Inverse of `get_baseline_index`.
 */
void get_antenna_pair_from_baseline(int baseline, int& ant1, int& ant2);


/**
 * @brief Compute where the correlator stores the product of PFB outputs `out1` and `out2`.
 * @details The correlator only stores products whose first output number is not smaller
 * than the second. When `out2 > out1` the roles are swapped and the stored value must be
 * conjugated. With (A, pA) and (B, pB) the antenna and polarisation of the first and second
 * output in storage order, the offset is `2 * A * (A + 1) + 4 * B + 2 * pB + pA`.
 */
CorrelatorIndex get_correlator_index(int out1, int out2);


/**
 * @brief Fill the correlator index and conjugation tables for every baseline and
 * polarisation product.
 * @param ants_to_pf: mapping from (antenna, pol) to PFB input number. Must contain all
 * 128 antennas with both polarisations.
 * @param in_to_out: 256-element mapping from PFB input to PFB output number, as returned
 * by `get_pfb_input_to_output_mapping`.
 * @param map_inds: pre-allocated buffer of `8256 * 4` elements receiving the offsets.
 * @param conj: pre-allocated buffer of `8256 * 4` elements receiving the conjugation flags.
 */
void generate_map(const antenna_mapping_t& ants_to_pf, const std::vector<int>& in_to_out,
        MemoryBuffer<int>& map_inds, MemoryBuffer<bool>& conj);


BaselineMap generate_map(const antenna_mapping_t& ants_to_pf, const std::vector<int>& in_to_out);

#endif
