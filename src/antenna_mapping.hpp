#ifndef __CORRMAP_ANTENNA_MAPPING__H_
#define __CORRMAP_ANTENNA_MAPPING__H_

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "constants.hpp"


struct antenna_pol_hash {
    std::size_t operator()(const std::pair<int, int>& key) const {
        return std::hash<int>{}(key.first * N_POLS + key.second);
    }
};

/**
 * Maps an (antenna, polarisation) pair to the PFB input number it is connected to.
 */
using antenna_mapping_t = std::unordered_map<std::pair<int, int>, int, antenna_pol_hash>;


/**
 * @brief Build the (antenna, polarisation) -> PFB input mapping from the antenna
 * numbers listed in input order, as found in the metafits file.
 * @param antenna_numbers: `antenna_numbers[i]` is the antenna connected to the
 * i-th pair of PFB inputs. Must list every antenna in [0, 128) exactly once.
 * @return a mapping where `(antenna_numbers[i], p)` is associated to `2 * i + p`.
 */
antenna_mapping_t get_antenna_to_pfb_mapping(const std::vector<int>& antenna_numbers);


/**
 * @brief Look up the PFB input of (antenna, pol), throwing std::out_of_range
 * with a message naming the key if it is missing.
 */
int get_pfb_input(const antenna_mapping_t& ants_to_pf, int antenna, int pol);


std::string antenna_pol_to_string(int antenna, int pol);

#endif
