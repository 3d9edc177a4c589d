#ifndef __CORRMAP_MAPPING__H_
#define __CORRMAP_MAPPING__H_

#include <astroio.hpp>
#include <complex>
#include <vector>
#include "baseline_map.hpp"


/**
 * @brief Reorder raw correlator visibilities into the standard baseline order.
 * @param vis: Visibilities object as read from a legacy correlator file, i.e. with
 * every (interval, channel) block of `8256 * 4` values in correlator storage order.
 * @param map: lookup tables returned by `generate_map`.
 * @details Value `k` of each output block is taken from offset `map.map_inds[k]` of
 * the same input block and conjugated when `map.conj[k]` is set. The output is
 * ordered by baseline (0,0), (0,1), ..., (127,127) and then by polarisation
 * product `2 * p1 + p2`.
 * If the visibilities are on GPU, the map is moved to GPU memory too.
 * @return A Visibilities object containing reordered data.
*/
Visibilities reorder_visibilities(const Visibilities& vis, BaselineMap& map);

/**
 * @brief CPU implementation of `reorder_visibilities`.
*/
Visibilities reorder_visibilities_cpu(const Visibilities& vis, const BaselineMap& map);

/**
 * @brief Reorder `n_blocks` consecutive raw blocks from `raw` into `out`. The two
 * buffers must not overlap.
*/
void reorder_visibilities_cpu(const std::complex<float>* raw, std::complex<float>* out, size_t n_blocks,
        const MemoryBuffer<int>& map_inds, const MemoryBuffer<bool>& conj);


/**
 * @brief Zero all polarisation products of the given baselines, in every
 * (interval, channel) block of reordered visibilities.
 * @param bad_baselines: baseline indices as returned by `get_bad_ants`.
*/
void flag_baselines(Visibilities& vis, const std::vector<int>& bad_baselines);

void flag_baselines_cpu(std::complex<float>* data, size_t n_blocks, const std::vector<int>& bad_baselines);


/**
 * @brief Apply the same gather as `reorder_visibilities_cpu` to per-sample missing-data
 * flags, so that `out[b * 33024 + k] = raw_flags[b * 33024 + map_inds[k]]`. Flags are
 * never conjugated.
*/
void reorder_flags_cpu(const bool* raw_flags, bool* out, size_t n_blocks, const MemoryBuffer<int>& map_inds);


/**
 * @brief Number of (interval, channel) blocks in `vis`. Throws std::invalid_argument
 * unless `vis` holds 128-antenna data of exactly `blocks * 8256 * 4` values.
*/
size_t get_n_visibility_blocks(const Visibilities& vis, const char* caller);

#endif
