#include <astroio.hpp>
#include "mapping.hpp"
#include "mapping_gpu.hpp"
#include <algorithm>
#include <stdexcept>



__global__ void reorder_visibilities_kernel(const float *current_vis, const int *map_inds, const bool *conj, float *new_vis){
    const unsigned int matrix_size {MAP_SIZE * 2};
    const unsigned int n_channels {gridDim.y};
    const unsigned int interval {blockIdx.x};
    const unsigned int ch {blockIdx.y};
    const size_t block_offset {(static_cast<size_t>(interval) * n_channels + ch) * matrix_size};

    new_vis = new_vis + block_offset;
    current_vis = current_vis + block_offset;

    for(unsigned int k {threadIdx.x}; k < MAP_SIZE; k += blockDim.x){
        const unsigned int src_idx {static_cast<unsigned int>(map_inds[k]) * 2};
        // copy the real part
        new_vis[k * 2] = current_vis[src_idx];
        // now the imaginary part, and conjugate if necessary
        new_vis[k * 2 + 1] = conj[k] ? (-current_vis[src_idx + 1]) : current_vis[src_idx + 1];
    }
}



__global__ void flag_baselines_kernel(float *vis, const int *bad_baselines, unsigned int n_bad){
    const unsigned int matrix_size {MAP_SIZE * 2};
    const unsigned int n_channels {gridDim.y};
    const size_t block_offset {(static_cast<size_t>(blockIdx.x) * n_channels + blockIdx.y) * matrix_size};
    vis = vis + block_offset;

    for(unsigned int i {threadIdx.x}; i < n_bad * N_POL_PRODUCTS * 2; i += blockDim.x){
        const unsigned int baseline {static_cast<unsigned int>(bad_baselines[i / (N_POL_PRODUCTS * 2)])};
        vis[baseline * N_POL_PRODUCTS * 2 + i % (N_POL_PRODUCTS * 2)] = 0.0f;
    }
}



Visibilities reorder_visibilities_gpu(const Visibilities& vis, const BaselineMap& map){
    if(num_available_gpus() == 0) throw std::runtime_error("reorder_visibilities_gpu: no GPUs detected.");
    if(!vis.on_gpu()) throw std::runtime_error("reorder_visibilities_gpu: 'vis' is not allocated on GPU.");
    if(!map.map_inds.on_gpu() || !map.conj.on_gpu())
        throw std::runtime_error("reorder_visibilities_gpu: 'map' is not allocated on GPU.");
    if(map.map_inds.size() != static_cast<size_t>(MAP_SIZE) || map.conj.size() != static_cast<size_t>(MAP_SIZE))
        throw std::invalid_argument("reorder_visibilities_gpu: 'map' has the wrong number of elements.");
    get_n_visibility_blocks(vis, "reorder_visibilities_gpu");

    const unsigned int n_channels {vis.nFrequencies};
    const unsigned int n_intervals {static_cast<unsigned int>(vis.integration_intervals())};

    Visibilities final_vis {vis};

    float* new_vis {reinterpret_cast<float*>(final_vis.data())};
    const float* curr_vis {reinterpret_cast<const float*>(vis.data())};

    const int threads_per_block {1024};
    const dim3 n_blocks {n_intervals, n_channels};

    reorder_visibilities_kernel<<<n_blocks, threads_per_block>>>(curr_vis, map.map_inds.data(), map.conj.data(), new_vis);
    gpuCheckLastError();
    gpuDeviceSynchronize();
    
    return final_vis;
}



void flag_baselines_gpu(Visibilities& vis, const std::vector<int>& bad_baselines){
    if(num_available_gpus() == 0) throw std::runtime_error("flag_baselines_gpu: no GPUs detected.");
    if(!vis.on_gpu()) throw std::runtime_error("flag_baselines_gpu: 'vis' is not allocated on GPU.");
    get_n_visibility_blocks(vis, "flag_baselines_gpu");
    if(bad_baselines.empty()) return;

    MemoryBuffer<int> mb_bad {bad_baselines.size()};
    std::copy(bad_baselines.begin(), bad_baselines.end(), mb_bad.data());
    mb_bad.to_gpu();

    const int threads_per_block {1024};
    const dim3 n_blocks {static_cast<unsigned int>(vis.integration_intervals()), vis.nFrequencies};

    flag_baselines_kernel<<<n_blocks, threads_per_block>>>(reinterpret_cast<float*>(vis.data()), mb_bad.data(),
        static_cast<unsigned int>(bad_baselines.size()));
    gpuCheckLastError();
    gpuDeviceSynchronize();
}
