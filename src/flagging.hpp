#ifndef __CORRMAP_FLAGGING__H_
#define __CORRMAP_FLAGGING__H_

#include <vector>
#include "constants.hpp"


/**
 * @brief Find the baselines involving at least one flagged antenna.
 * @param flagged_antennas: antenna numbers in [0, 128). Repetitions are allowed.
 * @return the indices (see `get_baseline_index`) of the affected baselines, in
 * ascending order.
 */
std::vector<int> get_bad_ants(const std::vector<int>& flagged_antennas);


/**
 * @brief Select the flagged antennas from the metafits antenna table.
 * @param antenna_numbers: antenna number of each table row.
 * @param flags: flag of each table row, non-zero meaning flagged.
 * @return flagged antenna numbers sorted in ascending order.
 */
std::vector<int> get_flagged_antennas(const std::vector<int>& antenna_numbers, const std::vector<int>& flags);

#endif
