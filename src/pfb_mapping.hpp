#ifndef __CORRMAP_PFB_MAPPING__H_
#define __CORRMAP_PFB_MAPPING__H_

#include <vector>
#include "constants.hpp"

/**
 * @brief Wiring of the first 64 PFB inputs. Entry `i` is the input that ends up
 * on output `i` of a PFB block, i.e. `floor(i / 4) + (i % 4) * 16`.
 */
extern const int PFB_MAPPER[PFB_BLOCK_SIZE];

/**
 * @brief Build the mapping from PFB input number to PFB output number.
 * @details The base permutation `PFB_MAPPER` is replicated over the four
 * blocks of 64 inputs: `mapping[PFB_MAPPER[i] + p * 64] = p * 64 + i`.
 * The result is meant to be computed once by the caller and then passed
 * around by reference.
 * @return a vector of 256 elements, indexed by PFB input number.
 */
std::vector<int> get_pfb_input_to_output_mapping();

#endif
