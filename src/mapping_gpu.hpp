#ifndef __CORRMAP_MAPPING_GPU__H_
#define __CORRMAP_MAPPING_GPU__H_

#include <astroio.hpp>
#include <gpu_macros.hpp>
#include <vector>
#include "baseline_map.hpp"


Visibilities reorder_visibilities_gpu(const Visibilities& vis, const BaselineMap& map);

void flag_baselines_gpu(Visibilities& vis, const std::vector<int>& bad_baselines);

#endif
